#include "kernjs/kernjs.h"
#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace kernjs;

namespace {

template <typename F>
std::string errorMessageOf(F&& f) {
  try {
    f();
  } catch (const JsException& e) {
    return e.what();
  }
  assert(false && "expected a JsException");
  return {};
}

bool startsWith(const std::string& s, const std::string& prefix) {
  return s.rfind(prefix, 0) == 0;
}

std::shared_ptr<FunctionDeclaration> declare(const std::string& name,
                                             std::vector<std::string> params,
                                             FunctionBody body) {
  auto fd = std::make_shared<FunctionDeclaration>();
  fd->name = name;
  fd->parameterNames = std::move(params);
  fd->body = std::move(body);
  return fd;
}

std::shared_ptr<Object> argumentsObject(Engine& engine) {
  return engine.getIdentifierValue("arguments").asObject();
}

}  // namespace

void testCallReturnValues() {
  std::cout << "Test: Call completions" << std::endl;

  Engine engine;
  auto add = engine.createFunction(declare("add", {"a", "b"}, [](Engine& engine) {
    double sum = engine.getIdentifierValue("a").asNumber() + engine.getIdentifierValue("b").asNumber();
    return Completion::returnValue(Value(sum));
  }), engine.globalEnvironment(), false);
  assert(add->call(Value(), {Value(2), Value(3)}).asNumber() == 5);
  assert(add->name() == "add");
  assert(add->length() == 2);
  assert(add->getPrototypeOf() == engine.functionPrototype());

  // Falling off the end yields undefined even with a value.
  auto normal = engine.createFunction(declare("normal", {}, [](Engine&) {
    return Completion::normal(Value(9));
  }), engine.globalEnvironment(), false);
  assert(normal->call(Value(), {}).isUndefined());

  // Missing arguments read as undefined.
  auto missing = engine.createFunction(declare("missing", {"x"}, [](Engine& engine) {
    return Completion::returnValue(Value(engine.getIdentifierValue("x").isUndefined()));
  }), engine.globalEnvironment(), false);
  assert(missing->call(Value(), {}).asBool());

  std::cout << "  PASSED" << std::endl;
}

void testCompletionTags() {
  std::cout << "Test: Completion tags" << std::endl;

  Engine engine;
  auto falls = engine.createFunction(declare("f", {}, [](Engine&) {
    return Completion::normal();
  }), engine.globalEnvironment(), false);
  Completion completion = falls->callWithCompletion(Value(), {});
  assert(completion.type == CompletionType::Normal);
  assert(!completion.isAbrupt());
  assert(falls->call(Value(), {}).isUndefined());

  auto explicitReturn = engine.createFunction(declare("e", {}, [](Engine&) {
    return Completion::returnValue();
  }), engine.globalEnvironment(), false);
  completion = explicitReturn->callWithCompletion(Value(), {});
  assert(completion.type == CompletionType::Return);
  assert(completion.isAbrupt());
  assert(completion.value.isUndefined());
  assert(explicitReturn->call(Value(), {}).isUndefined());

  auto returns = engine.createFunction(declare("r", {}, [](Engine&) {
    return Completion::returnValue(Value("done"));
  }), engine.globalEnvironment(), false);
  completion = returns->callWithCompletion(Value(), {});
  assert(completion.type == CompletionType::Return);
  assert(completion.isAbrupt());
  assert(completion.value.asString() == "done");

  auto throws = engine.createFunction(declare("t", {}, [](Engine&) {
    return Completion::throwValue(Value(42));
  }), engine.globalEnvironment(), false);
  completion = throws->callWithCompletion(Value(), {});
  assert(completion.type == CompletionType::Throw);
  assert(completion.value.asNumber() == 42);
  assert(engine.contextStack().depth() == 1);

  // A thrown non-error value propagates unchanged.
  try {
    throws->call(Value(), {});
    assert(false);
  } catch (const JsException& e) {
    assert(e.value().isNumber() && e.value().asNumber() == 42);
    assert(std::string(e.what()) == "Uncaught 42");
  }
  assert(engine.contextStack().depth() == 1);

  auto breaks = engine.createFunction(declare("b", {}, [](Engine&) {
    return Completion::breakTo("outer");
  }), engine.globalEnvironment(), false);
  assert(breaks->callWithCompletion(Value(), {}).target == "outer");
  bool threw = false;
  try {
    breaks->call(Value(), {});
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
  assert(engine.contextStack().depth() == 1);

  auto continues = engine.createFunction(declare("c", {}, [](Engine&) {
    return Completion::continueTo();
  }), engine.globalEnvironment(), false);
  completion = continues->callWithCompletion(Value(), {});
  assert(completion.type == CompletionType::Continue);
  assert(completion.target.empty());

  std::cout << "  PASSED" << std::endl;
}

void testCallEnvironmentReleased() {
  std::cout << "Test: Call environment released after return" << std::endl;

  Engine engine;
  std::weak_ptr<EnvironmentRecord> callEnv;
  FunctionBody capture = [&callEnv](Engine& engine) {
    callEnv = engine.runningContext().lexicalEnvironment;
    return Completion::returnValue(argumentsObject(engine)->get("length"));
  };

  auto strictFn = engine.createFunction(declare("strictFn", {"a", "b"}, capture),
                                        engine.globalEnvironment(), true);
  assert(strictFn->call(Value(), {Value(1), Value(2)}).asNumber() == 2);
  assert(callEnv.expired());

  auto noArgs = engine.createFunction(declare("noArgs", {"a"}, capture),
                                      engine.globalEnvironment(), false);
  assert(noArgs->call(Value(), {}).asNumber() == 0);
  assert(callEnv.expired());

  auto noParams = engine.createFunction(declare("noParams", {}, capture),
                                        engine.globalEnvironment(), false);
  assert(noParams->call(Value(), {Value(1)}).asNumber() == 1);
  assert(callEnv.expired());

  std::cout << "  PASSED" << std::endl;
}

void testConstruct() {
  std::cout << "Test: Construct" << std::endl;

  Engine engine;
  auto point = engine.createFunction(declare("Point", {"x"}, [](Engine& engine) {
    engine.thisValue().asObject()->put("x", engine.getIdentifierValue("x"), true);
    return Completion::returnValue(Value(5));
  }), engine.globalEnvironment(), false);

  auto instance = point->construct({Value(3)});
  assert(instance->get("x").asNumber() == 3);
  auto prototype = point->get("prototype").asObject();
  assert(instance->getPrototypeOf() == prototype);
  assert(prototype->get("constructor").asObject() == point);

  auto prototypeDesc = point->getOwnProperty("prototype");
  assert(prototypeDesc->writable() && !prototypeDesc->enumerable() && !prototypeDesc->configurable());

  // An object return value replaces the new instance.
  auto replacement = engine.createObject();
  auto factory = engine.createFunction(declare("factory", {}, [replacement](Engine&) {
    return Completion::returnValue(Value(replacement));
  }), engine.globalEnvironment(), false);
  assert(factory->construct({}) == replacement);

  // A non-object "prototype" falls back to Object.prototype.
  point->put("prototype", Value(1), true);
  assert(point->construct({Value(1)})->getPrototypeOf() == engine.objectPrototype());

  auto plain = engine.createNativeFunction("plain", 0, [](Engine&, const Value&, const std::vector<Value>&) {
    return Value();
  });
  assert(!plain->isConstructor());
  std::string message = errorMessageOf([&] { plain->construct({}); });
  assert(message == "TypeError: plain is not a constructor");

  std::cout << "  PASSED" << std::endl;
}

void testThisBinding() {
  std::cout << "Test: this binding" << std::endl;

  Engine engine;
  auto body = [](Engine& engine) { return Completion::returnValue(engine.thisValue()); };
  auto sloppy = engine.createFunction(declare("sloppy", {}, body), engine.globalEnvironment(), false);
  auto strict = engine.createFunction(declare("strict", {}, body), engine.globalEnvironment(), true);

  assert(sloppy->call(Value(), {}).asObject() == engine.globalObject());
  assert(sloppy->call(Value(Null{}), {}).asObject() == engine.globalObject());
  auto boxed = sloppy->call(Value(7), {}).tryCast<NumberObject>();
  assert(boxed);
  assert(boxed->primitiveValue().asNumber() == 7);

  assert(strict->call(Value(), {}).isUndefined());
  assert(strict->call(Value(7), {}).asNumber() == 7);
  assert(strict->isStrict());

  auto obj = engine.createObject();
  assert(sloppy->call(Value(obj), {}).asObject() == obj);

  // Native functions see the receiver as passed.
  auto native = engine.createNativeFunction("n", 0, [](Engine&, const Value& thisArg, const std::vector<Value>&) {
    return thisArg;
  });
  assert(native->call(Value(), {}).isUndefined());

  std::cout << "  PASSED" << std::endl;
}

void testDeclarationInstantiation() {
  std::cout << "Test: Declaration binding instantiation" << std::endl;

  Engine engine;
  auto inner = declare("a", {}, [](Engine&) { return Completion::returnValue(Value("inner")); });

  bool checked = false;
  auto fd = declare("outer", {"a", "b"}, [&checked](Engine& engine) {
    // Nested function declarations replace parameters of the same name;
    // var declarations do not reset them.
    assert(engine.getIdentifierValue("a").isCallable());
    assert(engine.getIdentifierValue("b").asNumber() == 2);
    assert(engine.getIdentifierValue("c").isUndefined());
    assert(engine.getIdentifierValue("arguments").isObject());
    checked = true;
    return Completion::normal();
  });
  fd->functionDeclarations.push_back(inner);
  fd->varNames = {"b", "c"};

  auto fn = engine.createFunction(fd, engine.globalEnvironment(), false);
  fn->call(Value(), {Value(1), Value(2)});
  assert(checked);

  // Duplicate parameter names: the last one wins.
  auto dup = engine.createFunction(declare("dup", {"x", "x"}, [](Engine& engine) {
    return Completion::returnValue(engine.getIdentifierValue("x"));
  }), engine.globalEnvironment(), false);
  assert(dup->call(Value(), {Value(1), Value(2)}).asNumber() == 2);
  assert(dup->call(Value(), {Value(1)}).isUndefined());

  // A parameter named "arguments" shadows the arguments object.
  auto shadow = engine.createFunction(declare("shadow", {"arguments"}, [](Engine& engine) {
    return Completion::returnValue(engine.getIdentifierValue("arguments"));
  }), engine.globalEnvironment(), false);
  assert(shadow->call(Value(), {Value("mine")}).asString() == "mine");

  std::cout << "  PASSED" << std::endl;
}

void testMappedArguments() {
  std::cout << "Test: Mapped arguments" << std::endl;

  Engine engine;
  std::shared_ptr<Function> self;
  auto fn = engine.createFunction(declare("mapped", {"a", "b"}, [&self](Engine& engine) {
    auto args = argumentsObject(engine);
    assert(args->get("length").asNumber() == 1);
    assert(args->get("callee").asObject() == self);
    assert(!args->getOwnProperty("length")->enumerable());

    args->put("0", Value(10), true);
    assert(engine.getIdentifierValue("a").asNumber() == 10);
    engine.putIdentifierValue("a", Value(20));
    assert(args->get("0").asNumber() == 20);
    assert(args->getOwnProperty("0")->value().asNumber() == 20);

    // Only indices below the argument count are mapped.
    args->put("1", Value(30), true);
    assert(engine.getIdentifierValue("b").isUndefined());

    // Deleting removes the alias for good.
    assert(args->deleteProperty("0", true));
    args->put("0", Value(40), true);
    assert(engine.getIdentifierValue("a").asNumber() == 20);
    return Completion::normal();
  }), engine.globalEnvironment(), false);
  self = fn;
  fn->call(Value(), {Value(1)});

  // Freezing an index captures the current value and unmaps it.
  auto frozen = engine.createFunction(declare("frozen", {"p"}, [](Engine& engine) {
    auto args = argumentsObject(engine);
    engine.putIdentifierValue("p", Value("late"));
    PropertyDescriptor readOnly;
    readOnly.setWritable(false);
    assert(args->defineOwnProperty("0", readOnly, true));
    assert(args->getOwnProperty("0")->value().asString() == "late");
    engine.putIdentifierValue("p", Value("later"));
    assert(args->get("0").asString() == "late");
    return Completion::normal();
  }), engine.globalEnvironment(), false);
  frozen->call(Value(), {Value("early")});

  // Duplicate parameters leave the arguments object unmapped.
  auto dup = engine.createFunction(declare("dup", {"x", "x"}, [](Engine& engine) {
    auto args = argumentsObject(engine);
    args->put("1", Value("changed"), true);
    assert(engine.getIdentifierValue("x").asString() == "second");
    return Completion::normal();
  }), engine.globalEnvironment(), false);
  dup->call(Value(), {Value("first"), Value("second")});

  std::cout << "  PASSED" << std::endl;
}

void testStrictArguments() {
  std::cout << "Test: Strict arguments and poisoned accessors" << std::endl;

  Engine engine;
  auto fn = engine.createFunction(declare("strictFn", {"a"}, [](Engine& engine) {
    auto args = argumentsObject(engine);
    args->put("0", Value(10), true);
    assert(engine.getIdentifierValue("a").asNumber() == 1);

    std::string message = errorMessageOf([&] { args->get("callee"); });
    assert(startsWith(message, "TypeError:"));
    message = errorMessageOf([&] { args->put("caller", Value(1), true); });
    assert(startsWith(message, "TypeError:"));

    // The arguments binding itself is immutable in strict code.
    message = errorMessageOf([&] { engine.putIdentifierValue("arguments", Value(1)); });
    assert(startsWith(message, "TypeError:"));
    return Completion::normal();
  }), engine.globalEnvironment(), true);
  fn->call(Value(), {Value(1)});

  std::string message = errorMessageOf([&] { fn->get("caller"); });
  assert(startsWith(message, "TypeError:"));
  message = errorMessageOf([&] { fn->get("arguments"); });
  assert(startsWith(message, "TypeError:"));
  auto desc = fn->getOwnProperty("caller");
  assert(desc->isAccessorDescriptor() && !desc->configurable());
  assert(desc->getter().asObject() == engine.throwTypeErrorFunction());
  assert(!engine.throwTypeErrorFunction()->isExtensible());

  auto sloppy = engine.createFunction(declare("sloppyFn", {}, nullptr), engine.globalEnvironment(), false);
  assert(!sloppy->hasOwnProperty("caller"));
  assert(sloppy->call(Value(), {}).isUndefined());

  std::cout << "  PASSED" << std::endl;
}

void testBoundFunctions() {
  std::cout << "Test: Bound functions" << std::endl;

  Engine engine;
  auto target = engine.createFunction(declare("Pair", {"a", "b", "c"}, [](Engine& engine) {
    auto self = engine.thisValue().asObject();
    self->put("a", engine.getIdentifierValue("a"), true);
    self->put("b", engine.getIdentifierValue("b"), true);
    return Completion::returnValue(engine.thisValue());
  }), engine.globalEnvironment(), true);

  auto receiver = engine.createObject();
  auto bound = BoundFunction::create(engine, target, Value(receiver), {Value("first")});
  assert(bound->name() == "bound Pair");
  assert(bound->length() == 2);
  assert(bound->isConstructor());
  assert(!bound->hasOwnProperty("prototype"));

  auto result = bound->call(Value(), {Value("second")}).asObject();
  assert(result == receiver);
  assert(receiver->get("a").asString() == "first");
  assert(receiver->get("b").asString() == "second");

  // Construct ignores the bound this and uses the target's prototype.
  auto instance = bound->construct({Value("x")});
  assert(instance != receiver);
  assert(instance->getPrototypeOf() == target->get("prototype").asObject());
  assert(instance->get("a").asString() == "first");

  auto overBound = BoundFunction::create(engine, target, Value(), {Value(1), Value(2), Value(3), Value(4)});
  assert(overBound->length() == 0);

  std::string message = errorMessageOf([&] { bound->get("caller"); });
  assert(startsWith(message, "TypeError:"));

  std::cout << "  PASSED" << std::endl;
}

void testGlobalExecution() {
  std::cout << "Test: Global code" << std::endl;

  Engine engine;
  Script script;
  script.functionDeclarations.push_back(declare("answer", {}, [](Engine&) {
    return Completion::returnValue(Value(42));
  }));
  script.varNames = {"counter"};
  script.body = [](Engine& engine) {
    auto answer = engine.getIdentifierValue("answer").tryCast<Function>();
    engine.putIdentifierValue("counter", answer->call(Value(), {}));
    return Completion::normal(engine.getIdentifierValue("counter"));
  };
  assert(engine.execute(script).asNumber() == 42);

  auto desc = engine.globalObject()->getOwnProperty("answer");
  assert(desc->enumerable() && desc->writable() && !desc->configurable());
  assert(!engine.globalObject()->deleteProperty("counter", false));

  // Redeclaring keeps an existing var's value.
  Script again;
  again.varNames = {"counter"};
  engine.execute(again);
  assert(engine.globalObject()->get("counter").asNumber() == 42);

  Script clash;
  clash.functionDeclarations.push_back(declare("NaN", {}, nullptr));
  std::string message = errorMessageOf([&] { engine.execute(clash); });
  assert(message == "TypeError: Cannot redefine global function 'NaN'");
  assert(engine.contextStack().depth() == 1);

  Script throwing;
  throwing.body = [](Engine&) { return Completion::throwValue(Value("oops")); };
  message = errorMessageOf([&] { engine.execute(throwing); });
  assert(message == "Uncaught \"oops\"");

  std::cout << "  PASSED" << std::endl;
}

void testFunctionPrototype() {
  std::cout << "Test: Function.prototype" << std::endl;

  Engine engine;
  const auto& proto = engine.functionPrototype();
  assert(proto->isCallable());
  assert(proto->call(Value(), {Value(1)}).isUndefined());
  assert(proto->getPrototypeOf() == engine.objectPrototype());
  assert(proto->name().empty());
  assert(proto->length() == 0);

  std::cout << "  PASSED" << std::endl;
}

void testStackTraces() {
  std::cout << "Test: Stack traces" << std::endl;

  Engine engine;
  Script script;
  script.functionDeclarations.push_back(declare("inner", {}, [](Engine& engine) -> Completion {
    engine.throwTypeError("bad thing");
  }));
  script.functionDeclarations.push_back(declare("outer", {}, [](Engine& engine) {
    engine.getIdentifierValue("inner").tryCast<Function>()->call(Value(), {});
    return Completion::normal();
  }));
  script.body = [](Engine& engine) {
    engine.getIdentifierValue("outer").tryCast<Function>()->call(Value(), {});
    return Completion::normal();
  };

  try {
    engine.execute(script);
    assert(false);
  } catch (const JsException& e) {
    auto error = e.value().tryCast<ErrorObject>();
    assert(error);
    assert(error->errorType() == ErrorType::TypeError);
    const auto& frames = error->stackTrace();
    assert(frames.size() == 3);
    assert(frames[0].functionName == "inner");
    assert(frames[1].functionName == "outer");
    assert(frames[2].functionName == "<global>");
    assert(error->get("stack").asString() ==
           "TypeError: bad thing\n  at inner\n  at outer\n  at <global>");

    std::ostringstream out;
    engine.reportException(e, out);
    assert(out.str() == "TypeError: bad thing\n  at inner\n  at outer\n  at <global>\n");
  }
  assert(engine.contextStack().depth() == 1);

  std::cout << "  PASSED" << std::endl;
}

void testRecursionLimit() {
  std::cout << "Test: Recursion limit" << std::endl;

  EngineOptions options;
  options.maxCallDepth = 50;
  options.captureStackTraces = false;
  Engine engine(options);

  Script script;
  script.functionDeclarations.push_back(declare("recurse", {}, [](Engine& engine) {
    engine.getIdentifierValue("recurse").tryCast<Function>()->call(Value(), {});
    return Completion::normal();
  }));
  engine.execute(script);

  auto recurse = engine.globalObject()->get("recurse").tryCast<Function>();
  std::string message = errorMessageOf([&] { recurse->call(Value(), {}); });
  assert(message == "RangeError: Maximum call stack size exceeded");
  assert(engine.contextStack().depth() == 1);

  std::cout << "  PASSED" << std::endl;
}

int main() {
  std::cout << "=== Function Tests ===" << std::endl << std::endl;

  testCallReturnValues();
  testCompletionTags();
  testCallEnvironmentReleased();
  testConstruct();
  testThisBinding();
  testDeclarationInstantiation();
  testMappedArguments();
  testStrictArguments();
  testBoundFunctions();
  testGlobalExecution();
  testFunctionPrototype();
  testStackTraces();
  testRecursionLimit();

  std::cout << std::endl << "All function tests passed!" << std::endl;
  return 0;
}
