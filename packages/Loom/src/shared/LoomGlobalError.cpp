#include "shared/LoomGlobalError.h"

#include <exception>
#include <iostream>
#include <string>

namespace loom {

namespace {

void writeErrorMessage(const std::string& message) {
  std::cerr << "Loom global error: " << message << std::endl;
}

} // namespace

void reportGlobalError(const std::exception& ex) {
  writeErrorMessage(ex.what());
}

void reportGlobalError(const std::string& message) {
  writeErrorMessage(message);
}

void reportGlobalError(const std::exception_ptr& error) {
  if (!error) {
    reportGlobalError();
    return;
  }

  try {
    std::rethrow_exception(error);
  } catch (const std::exception& ex) {
    reportGlobalError(ex);
  } catch (...) {
    reportGlobalError();
  }
}

void reportGlobalError() {
  writeErrorMessage("Unknown error");
}

#ifndef NDEBUG
void reportDevWarning(const std::string& message) {
  std::cerr << "Warning: " << message << std::endl;
}
#endif

} // namespace loom
