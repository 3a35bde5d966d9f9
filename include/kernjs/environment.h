#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include "object.h"
#include "value.h"

namespace kernjs {

class Engine;

/**
 * A scope's bindings plus the link to the enclosing scope.
 *
 * The strict flag passed to the accessors selects how misuse is reported:
 * strict code gets ReferenceError/TypeError, sloppy code a silent default.
 */
class EnvironmentRecord : public std::enable_shared_from_this<EnvironmentRecord> {
public:
  EnvironmentRecord(Engine& engine, std::shared_ptr<EnvironmentRecord> outer);
  virtual ~EnvironmentRecord() = default;

  const std::shared_ptr<EnvironmentRecord>& outer() const { return outer_; }

  virtual bool hasBinding(const std::string& name) const = 0;
  virtual void createMutableBinding(const std::string& name, bool deletable) = 0;
  virtual void setMutableBinding(const std::string& name, const Value& value, bool strict) = 0;
  virtual Value getBindingValue(const std::string& name, bool strict) = 0;
  virtual bool deleteBinding(const std::string& name) = 0;
  virtual Value implicitThisValue() const { return Value(); }

protected:
  Engine& engine_;

private:
  std::shared_ptr<EnvironmentRecord> outer_;
};

using EnvironmentPtr = std::shared_ptr<EnvironmentRecord>;

class DeclarativeEnvironment : public EnvironmentRecord {
public:
  DeclarativeEnvironment(Engine& engine, std::shared_ptr<EnvironmentRecord> outer);

  bool hasBinding(const std::string& name) const override;
  // New mutable bindings start initialized to undefined.
  void createMutableBinding(const std::string& name, bool deletable) override;
  void setMutableBinding(const std::string& name, const Value& value, bool strict) override;
  Value getBindingValue(const std::string& name, bool strict) override;
  bool deleteBinding(const std::string& name) override;

  // Immutable bindings stay uninitialized until initializeBinding.
  void createImmutableBinding(const std::string& name, bool strict);
  void initializeBinding(const std::string& name, const Value& value);
  bool isInitialized(const std::string& name) const;
  bool isMutable(const std::string& name) const;

private:
  struct Binding {
    Value value;
    bool isMutable = true;
    bool initialized = false;
    bool deletable = false;
    bool strict = false;
  };

  Binding& lookup(const std::string& name);

  std::unordered_map<std::string, Binding> bindings_;
};

// Bindings are the properties of an object (the global object, or a with
// statement's operand).
class ObjectEnvironment : public EnvironmentRecord {
public:
  ObjectEnvironment(Engine& engine, std::shared_ptr<Object> bindingObject,
                    std::shared_ptr<EnvironmentRecord> outer, bool provideThis = false);

  const std::shared_ptr<Object>& bindingObject() const { return bindingObject_; }

  bool hasBinding(const std::string& name) const override;
  void createMutableBinding(const std::string& name, bool deletable) override;
  void setMutableBinding(const std::string& name, const Value& value, bool strict) override;
  Value getBindingValue(const std::string& name, bool strict) override;
  bool deleteBinding(const std::string& name) override;
  Value implicitThisValue() const override;

private:
  std::shared_ptr<Object> bindingObject_;
  bool provideThis_;
};

}  // namespace kernjs
