#include "kernjs/iterator.h"
#include "kernjs/engine.h"
#include "kernjs/symbols.h"

namespace kernjs {

IteratorObject::IteratorObject(Engine& engine, std::shared_ptr<Object> prototype)
  : Object(engine, std::move(prototype)) {}

std::shared_ptr<Object> IteratorObject::next() {
  if (!done_) {
    if (auto value = step()) {
      return engine_.createIterResultObject(*value, false);
    }
    done_ = true;
  }
  return engine_.createIterResultObject(Value(), true);
}

// ListIterator

ListIterator::ListIterator(Engine& engine, std::shared_ptr<Object> prototype,
                           std::vector<Value> values)
  : IteratorObject(engine, std::move(prototype)), values_(std::move(values)) {}

std::optional<Value> ListIterator::step() {
  if (position_ >= values_.size()) {
    values_.clear();
    return std::nullopt;
  }
  return values_[position_++];
}

// ArrayIterator

ArrayIterator::ArrayIterator(Engine& engine, std::shared_ptr<Object> prototype,
                             std::shared_ptr<Object> iterated, ArrayIterationKind kind)
  : IteratorObject(engine, std::move(prototype)), iterated_(std::move(iterated)), kind_(kind) {}

std::optional<Value> ArrayIterator::step() {
  if (!iterated_) {
    return std::nullopt;
  }
  uint32_t length = engine_.toUint32(iterated_->get("length"));
  if (index_ >= length) {
    iterated_.reset();
    return std::nullopt;
  }

  uint32_t index = index_++;
  switch (kind_) {
    case ArrayIterationKind::Keys:
      return Value(index);
    case ArrayIterationKind::Values:
      return iterated_->get(PropertyKey::fromIndex(index));
    case ArrayIterationKind::Entries:
      return Value(engine_.createArray({Value(index), iterated_->get(PropertyKey::fromIndex(index))}));
  }
  return std::nullopt;
}

// IteratorPrototype

IteratorPrototype::IteratorPrototype(Engine& engine, std::shared_ptr<Object> prototype)
  : Object(engine, std::move(prototype)) {}

std::shared_ptr<IteratorPrototype> IteratorPrototype::create(
    Engine& engine, std::shared_ptr<Object> prototype,
    const std::optional<std::string>& toStringTag) {
  auto proto = std::make_shared<IteratorPrototype>(engine, std::move(prototype));

  auto next = engine.createNativeFunction(
      "next", 0, [](Engine& engine, const Value& thisArg, const std::vector<Value>&) -> Value {
        auto iterator = thisArg.tryCast<IteratorObject>();
        if (!iterator) {
          engine.throwTypeError("next method called on incompatible receiver " +
                                thisArg.toDisplayString());
        }
        return Value(iterator->next());
      });
  proto->fastAddProperty("next", Value(next), PropertyFlag::NonEnumerable);

  auto self = engine.createNativeFunction(
      "[Symbol.iterator]", 0,
      [](Engine&, const Value& thisArg, const std::vector<Value>&) { return thisArg; });
  proto->fastAddProperty(WellKnownSymbols::iterator(), Value(self), PropertyFlag::NonEnumerable);

  if (toStringTag) {
    proto->fastAddProperty(WellKnownSymbols::toStringTag(), Value(*toStringTag),
                           PropertyFlag::Configurable);
  }
  return proto;
}

}  // namespace kernjs
