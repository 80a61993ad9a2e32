#pragma once

#include <exception>
#include <string>

namespace loom {

void reportGlobalError(const std::exception& ex);
void reportGlobalError(const std::string& message);
void reportGlobalError(const std::exception_ptr& error);
void reportGlobalError();

#ifndef NDEBUG
void reportDevWarning(const std::string& message);
#endif

} // namespace loom
