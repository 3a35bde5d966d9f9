#include "kernjs/kernjs.h"
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace kernjs;

namespace {

std::shared_ptr<FunctionDeclaration> declare(const std::string& name,
                                             std::vector<std::string> params,
                                             FunctionBody body) {
  auto fd = std::make_shared<FunctionDeclaration>();
  fd->name = name;
  fd->parameterNames = std::move(params);
  fd->body = std::move(body);
  return fd;
}

void runDemo(const std::string& name, Engine& engine, const std::function<Value()>& step) {
  std::cout << "Demo: " << name << std::endl;
  try {
    Value result = step();
    std::cout << "  Result: " << engine.toString(result) << std::endl;
  } catch (const JsException& e) {
    std::cout << "  Uncaught exception:" << std::endl;
    engine.reportException(e, std::cout);
  }
  std::cout << std::endl;
}

}  // namespace

int main() {
  std::cout << "=== kernjs " << version() << " runtime demo ===" << std::endl << std::endl;

  Engine engine;

  // function add(a, b) { return a + b; }
  // function Counter(start) { this.count = start; }
  // var total = add(40, 2);
  Script script;
  script.functionDeclarations.push_back(declare("add", {"a", "b"}, [](Engine& e) {
    double sum = e.toNumber(e.getIdentifierValue("a")) + e.toNumber(e.getIdentifierValue("b"));
    return Completion::returnValue(Value(sum));
  }));
  script.functionDeclarations.push_back(declare("Counter", {"start"}, [](Engine& e) {
    e.thisValue().asObject()->put("count", e.getIdentifierValue("start"), true);
    return Completion::normal();
  }));
  script.varNames = {"total"};
  script.body = [](Engine& e) {
    auto add = e.getIdentifierValue("add").tryCast<Function>();
    e.putIdentifierValue("total", add->call(Value(), {Value(40), Value(2)}));
    return Completion::normal(e.getIdentifierValue("total"));
  };

  runDemo("Global script", engine, [&] { return engine.execute(script); });

  runDemo("Constructor call", engine, [&] {
    auto counter = engine.globalObject()->get("Counter").tryCast<Function>();
    auto instance = counter->construct({Value(7)});
    return instance->get("count");
  });

  runDemo("Array length truncation", engine, [&] {
    auto array = engine.createArray({Value("a"), Value("b"), Value("c"), Value("d")});
    array->defineOwnProperty("1", PropertyDescriptor::data(Value("pinned"), true, true, false), true);
    bool ok = array->defineOwnProperty("length", PropertyDescriptor::data(Value(0), true, false, false),
                                       false);
    std::cout << "  defineOwnProperty(length, 0) -> " << (ok ? "true" : "false") << std::endl;
    return Value(array->length());
  });

  runDemo("Array iteration", engine, [&] {
    auto array = engine.createArray({Value(1), Value(2), Value(3)});
    auto iterator = engine.createArrayIterator(array, ArrayIterationKind::Entries);
    double sum = 0;
    for (auto result = iterator->next(); !result->get("done").asBool(); result = iterator->next()) {
      auto entry = result->get("value").asObject();
      sum += entry->get("0").asNumber() * entry->get("1").asNumber();
    }
    return Value(sum);
  });

  runDemo("Frozen property", engine, [&] {
    auto obj = engine.createObject();
    obj->defineOwnProperty("fixed", PropertyDescriptor::data(Value(1), false, true, false), true);
    obj->defineOwnProperty("fixed", PropertyDescriptor::data(Value(2), false, true, false), true);
    return obj->get("fixed");
  });

  runDemo("Stack trace", engine, [&] {
    auto fail = engine.createFunction(declare("fail", {}, [](Engine& e) -> Completion {
      e.throwReferenceError("missing is not defined");
    }), engine.globalEnvironment(), false);
    return fail->call(Value(), {});
  });

  return 0;
}
