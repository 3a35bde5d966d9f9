#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "object.h"

namespace kernjs {

/**
 * Iterator instance. next() yields {value, done} result objects; once the
 * producer is exhausted every later call reports done with an undefined
 * value.
 */
class IteratorObject : public Object {
public:
  IteratorObject(Engine& engine, std::shared_ptr<Object> prototype);

  const char* className() const override { return "Iterator"; }

  std::shared_ptr<Object> next();
  bool isDone() const { return done_; }

protected:
  // Next produced value, or nullopt when exhausted.
  virtual std::optional<Value> step() = 0;

private:
  bool done_ = false;
};

class ListIterator : public IteratorObject {
public:
  ListIterator(Engine& engine, std::shared_ptr<Object> prototype, std::vector<Value> values);

protected:
  std::optional<Value> step() override;

private:
  std::vector<Value> values_;
  size_t position_ = 0;
};

enum class ArrayIterationKind { Keys, Values, Entries };

// Walks an array-like object; "length" is re-read on every step.
class ArrayIterator : public IteratorObject {
public:
  ArrayIterator(Engine& engine, std::shared_ptr<Object> prototype,
                std::shared_ptr<Object> iterated, ArrayIterationKind kind);

  const char* className() const override { return "Array Iterator"; }

protected:
  std::optional<Value> step() override;

private:
  std::shared_ptr<Object> iterated_;
  ArrayIterationKind kind_;
  uint32_t index_ = 0;
};

// Shared prototype carrying next(), [Symbol.iterator]() and an optional
// Symbol.toStringTag.
class IteratorPrototype : public Object {
public:
  static std::shared_ptr<IteratorPrototype> create(Engine& engine,
                                                   std::shared_ptr<Object> prototype,
                                                   const std::optional<std::string>& toStringTag);

  IteratorPrototype(Engine& engine, std::shared_ptr<Object> prototype);
};

}  // namespace kernjs
