/***
 * Name: pymarshal::object::Object (copy and teardown)
 * Purpose: Deep copy and destruction of object trees without native recursion.
 * Theory of Operation:
 *   Copy: each container is first copied as a shell whose children are
 *   default-constructed, then every (source child, shell child) pair is queued
 *   and filled the same way. Shell vectors never grow after the pairs are
 *   queued, so the queued pointers stay valid.
 *
 *   Teardown: a destructor moves its children into a per-thread teardown list
 *   and drains the list in a loop; each drained child is emptied before it dies.
 *   When the last owner of a StoreRef target lets go inside that loop, the
 *   target's destructor sees the active list and hands its children over
 *   instead of starting a loop of its own.
 */
#include "pymarshal/object/object.h"

#include <cstddef>
#include <utility>
#include <variant>
#include <vector>

namespace pymarshal::object {

namespace {

struct Teardown {
  std::vector<Object> objects;
  std::vector<ObjectPtr> shared;
};

thread_local Teardown* activeTeardown = nullptr;

bool ownsChildren(const Object& value) {
  if (const auto* seq = std::get_if<SequenceValue>(&value.payload)) {
    return !seq->items.empty();
  }
  if (const auto* dict = std::get_if<DictValue>(&value.payload)) {
    return !dict->entries.empty();
  }
  if (const auto* code = std::get_if<CodeValue>(&value.payload)) {
    return !code->objects.empty();
  }
  if (const auto* store = std::get_if<StoreRefValue>(&value.payload)) {
    return store->target != nullptr;
  }
  return false;
}

void detachChildren(Object& value, Teardown& sink) {
  if (auto* seq = std::get_if<SequenceValue>(&value.payload)) {
    for (auto& item : seq->items) {
      sink.objects.push_back(std::move(item));
    }
    seq->items.clear();
  } else if (auto* dict = std::get_if<DictValue>(&value.payload)) {
    for (auto& entry : dict->entries) {
      sink.objects.push_back(std::move(entry.key));
      sink.objects.push_back(std::move(entry.value));
    }
    dict->entries.clear();
  } else if (auto* code = std::get_if<CodeValue>(&value.payload)) {
    for (auto& field : code->objects) {
      sink.objects.push_back(std::move(field));
    }
    code->objects.clear();
  } else if (auto* store = std::get_if<StoreRefValue>(&value.payload)) {
    if (store->target) {
      sink.shared.push_back(std::move(store->target));
    }
  }
}

using CopyQueue = std::vector<std::pair<const Object*, Object*>>;

void copyShell(const Object& source, Object& target, CopyQueue& pending) {
  target.kind = source.kind;
  if (const auto* seq = std::get_if<SequenceValue>(&source.payload)) {
    SequenceValue shell;
    shell.small = seq->small;
    shell.items.resize(seq->items.size());
    target.payload = std::move(shell);
    auto& items = std::get<SequenceValue>(target.payload).items;
    for (std::size_t i = 0; i < items.size(); ++i) {
      pending.emplace_back(&seq->items[i], &items[i]);
    }
    return;
  }
  if (const auto* dict = std::get_if<DictValue>(&source.payload)) {
    DictValue shell;
    shell.entries.resize(dict->entries.size());
    target.payload = std::move(shell);
    auto& entries = std::get<DictValue>(target.payload).entries;
    for (std::size_t i = 0; i < entries.size(); ++i) {
      pending.emplace_back(&dict->entries[i].key, &entries[i].key);
      pending.emplace_back(&dict->entries[i].value, &entries[i].value);
    }
    return;
  }
  if (const auto* code = std::get_if<CodeValue>(&source.payload)) {
    CodeValue shell;
    shell.layout = code->layout;
    shell.numbers = code->numbers;
    shell.objects.resize(code->objects.size());
    target.payload = std::move(shell);
    auto& objects = std::get<CodeValue>(target.payload).objects;
    for (std::size_t i = 0; i < objects.size(); ++i) {
      pending.emplace_back(&code->objects[i], &objects[i]);
    }
    return;
  }
  // No owned children; a StoreRef shares its target.
  target.payload = source.payload;
}

}  // namespace

Object::Object(const Object& other) {
  CopyQueue pending{{&other, this}};
  while (!pending.empty()) {
    const auto [source, target] = pending.back();
    pending.pop_back();
    copyShell(*source, *target, pending);
  }
}

Object& Object::operator=(const Object& other) {
  if (this != &other) {
    Object copy(other);
    *this = std::move(copy);
  }
  return *this;
}

Object::~Object() {
  if (!ownsChildren(*this)) {
    return;
  }
  if (activeTeardown != nullptr) {
    detachChildren(*this, *activeTeardown);
    return;
  }
  Teardown teardown;
  activeTeardown = &teardown;
  detachChildren(*this, teardown);
  while (!teardown.objects.empty() || !teardown.shared.empty()) {
    if (!teardown.objects.empty()) {
      Object current = std::move(teardown.objects.back());
      teardown.objects.pop_back();
      detachChildren(current, teardown);
      continue;
    }
    // Released outside of pop_back: the target's destructor appends to the lists.
    ObjectPtr released = std::move(teardown.shared.back());
    teardown.shared.pop_back();
    released.reset();
  }
  activeTeardown = nullptr;
}

}  // namespace pymarshal::object
