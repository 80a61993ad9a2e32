#include "LoomRuntime/LoomSchedulerBinding.h"

#include "LoomScheduler/LoomScheduler.h"
#include "LoomScheduler/SchedulerPriorities.h"

#include "jsi/jsi.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

namespace loom {

namespace {

using facebook::jsi::Function;
using facebook::jsi::JSError;
using facebook::jsi::Object;
using facebook::jsi::PropNameID;
using facebook::jsi::Runtime;
using facebook::jsi::Value;

SchedulerPriority priorityFromValue(const Value& value) {
  if (!value.isNumber()) {
    return SchedulerPriority::NormalPriority;
  }
  const double level = value.getNumber();
  if (level < static_cast<double>(static_cast<int>(SchedulerPriority::ImmediatePriority)) ||
      level > static_cast<double>(static_cast<int>(SchedulerPriority::IdlePriority))) {
    return SchedulerPriority::NormalPriority;
  }
  return static_cast<SchedulerPriority>(static_cast<std::uint8_t>(level));
}

double readPositiveNumber(Runtime& runtime, const Object& object, const char* name) {
  if (!object.hasProperty(runtime, name)) {
    return 0.0;
  }
  const Value value = object.getProperty(runtime, name);
  if (!value.isNumber() || value.getNumber() <= 0.0) {
    return 0.0;
  }
  return value.getNumber();
}

std::optional<double> readTimeout(Runtime& runtime, const Object& object) {
  if (!object.hasProperty(runtime, "timeout")) {
    return std::nullopt;
  }
  const Value value = object.getProperty(runtime, "timeout");
  if (!value.isNumber() || value.getNumber() < 0.0) {
    return std::nullopt;
  }
  return value.getNumber();
}

TaskCallback makeTaskCallback(Runtime& jsRuntime, std::shared_ptr<Function> function) {
  Runtime* runtimePtr = &jsRuntime;
  return [runtimePtr, function](bool didTimeout) -> TaskResult {
    Runtime& runtime = *runtimePtr;
    Value result = function->call(runtime, Value(didTimeout));
    if (!result.isObject()) {
      return TaskResult::done();
    }

    Object object = result.getObject(runtime);
    if (!object.isFunction(runtime)) {
      return TaskResult::done();
    }

    auto continuation = std::make_shared<Function>(object.asFunction(runtime));
    return TaskResult::continueWith(makeTaskCallback(runtime, std::move(continuation)));
  };
}

Function createFunction(
    Runtime& runtime,
    const char* name,
    unsigned int paramCount,
    facebook::jsi::HostFunctionType body) {
  return Function::createFromHostFunction(runtime, PropNameID::forAscii(runtime, name), paramCount, std::move(body));
}

void setPriorityConstants(Runtime& runtime, Object& target) {
  const SchedulerPriority priorities[] = {
    SchedulerPriority::ImmediatePriority,
    SchedulerPriority::UserBlockingPriority,
    SchedulerPriority::NormalPriority,
    SchedulerPriority::LowPriority,
    SchedulerPriority::IdlePriority,
  };
  for (SchedulerPriority priority : priorities) {
    target.setProperty(runtime, priorityName(priority), Value(static_cast<double>(static_cast<int>(priority))));
  }
}

} // namespace

void installSchedulerBinding(Runtime& jsRuntime, LoomScheduler& scheduler) {
  LoomScheduler* schedulerPtr = &scheduler;
  Object binding(jsRuntime);

  binding.setProperty(
    jsRuntime,
    "scheduleCallback",
    createFunction(
      jsRuntime,
      "scheduleCallback",
      3,
      [schedulerPtr](Runtime& runtime, const Value&, const Value* arguments, size_t count) -> Value {
        if (count < 2 || !arguments[1].isObject() || !arguments[1].getObject(runtime).isFunction(runtime)) {
          throw JSError(runtime, "LoomScheduler.scheduleCallback expects a function as its second argument");
        }

        const SchedulerPriority priority = priorityFromValue(arguments[0]);
        auto callback = std::make_shared<Function>(arguments[1].getObject(runtime).asFunction(runtime));

        TaskOptions options;
        if (count > 2 && arguments[2].isObject()) {
          const Object optionsObject = arguments[2].getObject(runtime);
          options.delayMs = readPositiveNumber(runtime, optionsObject, "delay");
          options.timeoutMs = readTimeout(runtime, optionsObject);
        }

        const TaskHandle handle = schedulerPtr->scheduleTask(priority, makeTaskCallback(runtime, std::move(callback)), options);
        return Value(static_cast<double>(handle.id));
      }));

  binding.setProperty(
    jsRuntime,
    "cancelCallback",
    createFunction(
      jsRuntime,
      "cancelCallback",
      1,
      [schedulerPtr](Runtime&, const Value&, const Value* arguments, size_t count) -> Value {
        if (count > 0 && arguments[0].isNumber() && arguments[0].getNumber() > 0.0) {
          schedulerPtr->cancelTask(TaskHandle{static_cast<std::uint64_t>(arguments[0].getNumber())});
        }
        return Value::undefined();
      }));

  binding.setProperty(
    jsRuntime,
    "shouldYield",
    createFunction(
      jsRuntime,
      "shouldYield",
      0,
      [schedulerPtr](Runtime&, const Value&, const Value*, size_t) -> Value {
        return Value(schedulerPtr->shouldYield());
      }));

  binding.setProperty(
    jsRuntime,
    "getCurrentPriorityLevel",
    createFunction(
      jsRuntime,
      "getCurrentPriorityLevel",
      0,
      [schedulerPtr](Runtime&, const Value&, const Value*, size_t) -> Value {
        return Value(static_cast<double>(static_cast<int>(schedulerPtr->getCurrentPriorityLevel())));
      }));

  binding.setProperty(
    jsRuntime,
    "now",
    createFunction(
      jsRuntime,
      "now",
      0,
      [schedulerPtr](Runtime&, const Value&, const Value*, size_t) -> Value {
        return Value(schedulerPtr->now());
      }));

  setPriorityConstants(jsRuntime, binding);

  jsRuntime.global().setProperty(jsRuntime, "LoomScheduler", std::move(binding));
}

} // namespace loom
