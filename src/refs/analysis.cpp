/***
 * Name: pymarshal::refs (analysis)
 * Purpose: Target discovery, used/recursive index sets and the rewriting engine.
 * Theory of Operation:
 *   Discovery, edge extraction and the rewriter all walk with explicit stacks.
 *   The rewriter fills output slots in pre-order, checks nesting against
 *   maxDepth, and counts every node it produces against a budget derived from
 *   the input size, so inlining a chain of doubly shared values fails with
 *   InvalidObjectError instead of growing exponentially.
 */
#include "pymarshal/refs/analysis.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "pymarshal/exceptions/invalid_object_error.h"
#include "pymarshal/exceptions/invalid_reference_error.h"
#include "pymarshal/exceptions/recursion_limit_error.h"
#include "pymarshal/object/traverse.h"

namespace pymarshal::refs {

using object::Object;
using object::ObjectKind;

namespace {

using TargetMap = std::unordered_map<std::uint32_t, const Object*>;

// Output size allowed for a rewrite: a multiple of the input's node count plus slack.
constexpr std::size_t kRewriteGrowthFactor = 16;
constexpr std::size_t kRewriteSlackNodes = std::size_t{1} << 16U;

struct Discovery {
  TargetMap targets;
  std::set<std::uint32_t> loads;
  std::size_t nodes{0};
};

// Walks the tree and every table entry once, recording StoreRef targets and LoadRef indices.
Discovery discover(const Object& root, const object::ReferenceTable& refs) {
  Discovery found;
  std::unordered_set<const Object*> walked;
  std::vector<const Object*> pending{&root};
  for (std::uint32_t i = 0; i < refs.size(); ++i) {
    if (const auto& entry = refs.at(i)) {
      if (walked.insert(entry.get()).second) {
        pending.push_back(entry.get());
      }
    }
  }
  // The root is walked first so tree targets win over table entries.
  std::vector<const Object*> order(pending.rbegin(), pending.rend());
  while (!order.empty()) {
    const Object* node = order.back();
    order.pop_back();
    ++found.nodes;
    if (node->kind == ObjectKind::LoadRef) {
      found.loads.insert(node->as<object::LoadRefValue>().index);
      continue;
    }
    if (node->kind == ObjectKind::StoreRef) {
      const auto& store = node->as<object::StoreRefValue>();
      if (!store.target) {
        continue;
      }
      found.targets.emplace(store.index, store.target.get());
      if (!walked.insert(store.target.get()).second) {
        continue;
      }
      order.push_back(store.target.get());
      continue;
    }
    std::vector<const Object*> children;
    object::ForEachChild(*node, [&children](const Object& child) { children.push_back(&child); });
    order.insert(order.end(), children.rbegin(), children.rend());
  }
  for (std::uint32_t i = 0; i < refs.size(); ++i) {
    if (const auto& entry = refs.at(i)) {
      found.targets.emplace(i, entry.get());
    }
  }
  return found;
}

std::set<std::uint32_t> directEdges(const Object& target) {
  std::set<std::uint32_t> edges;
  std::vector<const Object*> pending;
  object::ForEachChild(target, [&pending](const Object& child) { pending.push_back(&child); });
  while (!pending.empty()) {
    const Object* node = pending.back();
    pending.pop_back();
    if (node->kind == ObjectKind::LoadRef) {
      edges.insert(node->as<object::LoadRefValue>().index);
    } else if (node->kind == ObjectKind::StoreRef) {
      edges.insert(node->as<object::StoreRefValue>().index);
    } else {
      object::ForEachChild(*node, [&pending](const Object& child) { pending.push_back(&child); });
    }
  }
  return edges;
}

class Rewriter {
 public:
  Rewriter(const TargetMap& targets, const std::set<std::uint32_t>& keep, std::size_t maxDepth,
           std::size_t nodeBudget)
      : targets_(targets), keep_(keep), maxDepth_(maxDepth), nodeBudget_(nodeBudget) {}

  detail::RewriteResult run(const Object& root) {
    detail::RewriteResult result;
    pending_.push_back(Step{&root, &result.root, 0});
    while (!pending_.empty()) {
      const Step step = pending_.back();
      pending_.pop_back();
      rebuild(step);
    }
    result.refs = std::move(out_);
    result.inlinedLoads = inlined_;
    result.droppedStores = dropped_;
    return result;
  }

 private:
  // One output slot to fill from a source node; slots are never moved once queued.
  struct Step {
    const Object* source;
    Object* slot;
    std::size_t depth;
  };

  void rebuild(const Step& step) {
    if (step.depth > maxDepth_) {
      throw exceptions::RecursionLimitError("reference rewrite exceeds maximum depth " + std::to_string(maxDepth_));
    }
    const Object& node = *step.source;
    switch (node.kind) {
      case ObjectKind::StoreRef:
        resolve(node.as<object::StoreRefValue>().index, false, step);
        return;
      case ObjectKind::LoadRef:
        resolve(node.as<object::LoadRefValue>().index, true, step);
        return;
      default:
        break;
    }
    count();
    switch (node.kind) {
      case ObjectKind::Tuple:
      case ObjectKind::List:
      case ObjectKind::Set:
      case ObjectKind::FrozenSet: {
        const auto& seq = node.as<object::SequenceValue>();
        object::SequenceValue shell;
        shell.small = seq.small;
        shell.items.resize(seq.items.size());
        *step.slot = Object{node.kind, std::move(shell)};
        auto& items = step.slot->as<object::SequenceValue>().items;
        for (std::size_t i = items.size(); i-- > 0;) {
          pending_.push_back(Step{&seq.items[i], &items[i], step.depth + 1});
        }
        return;
      }
      case ObjectKind::Dict: {
        const auto& entries = node.as<object::DictValue>().entries;
        *step.slot = Object::Dict(std::vector<object::DictEntry>(entries.size()));
        auto& out = step.slot->as<object::DictValue>().entries;
        for (std::size_t i = out.size(); i-- > 0;) {
          pending_.push_back(Step{&entries[i].value, &out[i].value, step.depth + 1});
          pending_.push_back(Step{&entries[i].key, &out[i].key, step.depth + 1});
        }
        return;
      }
      case ObjectKind::Code: {
        const auto& code = node.as<object::CodeValue>();
        object::CodeValue shell;
        shell.layout = code.layout;
        shell.numbers = code.numbers;
        shell.objects.resize(code.objects.size());
        *step.slot = Object::Code(std::move(shell));
        auto& objects = step.slot->as<object::CodeValue>().objects;
        for (std::size_t i = objects.size(); i-- > 0;) {
          pending_.push_back(Step{&code.objects[i], &objects[i], step.depth + 1});
        }
        return;
      }
      default:
        *step.slot = node;
        return;
    }
  }

  void resolve(std::uint32_t index, bool isLoad, const Step& step) {
    const auto found = targets_.find(index);
    if (found == targets_.end()) {
      throw exceptions::InvalidReferenceError("reference " + std::to_string(index) + " has no target");
    }
    count();
    if (!keep_.contains(index)) {
      ++(isLoad ? inlined_ : dropped_);
      pending_.push_back(Step{found->second, step.slot, step.depth});
      return;
    }
    if (const auto seen = renumbered_.find(index); seen != renumbered_.end()) {
      *step.slot = Object::LoadRef(seen->second);
      return;
    }
    const std::uint32_t fresh = out_.reserve();
    renumbered_.emplace(index, fresh);
    // Filled in place by the queued step before anyone reads it.
    auto built = std::make_shared<Object>();
    out_.fill(fresh, built);
    *step.slot = Object::StoreRef(fresh, built);
    pending_.push_back(Step{found->second, built.get(), step.depth});
  }

  void count() {
    if (++produced_ > nodeBudget_) {
      throw exceptions::InvalidObjectError("reference rewrite exceeds " + std::to_string(nodeBudget_) +
                                           " nodes; shared values expand too far when inlined");
    }
  }

  const TargetMap& targets_;
  const std::set<std::uint32_t>& keep_;
  std::size_t maxDepth_;
  std::size_t nodeBudget_;
  std::vector<Step> pending_;
  std::unordered_map<std::uint32_t, std::uint32_t> renumbered_;
  object::ReferenceTable out_;
  std::size_t produced_{0};
  std::uint64_t inlined_{0};
  std::uint64_t dropped_{0};
};

}  // namespace

std::set<std::uint32_t> FindRecursiveRefs(const Object& root, const object::ReferenceTable& refs) {
  const Discovery found = discover(root, refs);
  std::unordered_map<std::uint32_t, std::set<std::uint32_t>> edges;
  for (const auto& [index, target] : found.targets) {
    edges.emplace(index, directEdges(*target));
  }
  std::set<std::uint32_t> recursive;
  for (const auto& [start, firstHop] : edges) {
    std::unordered_set<std::uint32_t> seen;
    std::vector<std::uint32_t> pending(firstHop.begin(), firstHop.end());
    while (!pending.empty()) {
      const std::uint32_t current = pending.back();
      pending.pop_back();
      if (current == start) {
        recursive.insert(start);
        break;
      }
      if (!seen.insert(current).second) {
        continue;
      }
      if (const auto next = edges.find(current); next != edges.end()) {
        pending.insert(pending.end(), next->second.begin(), next->second.end());
      }
    }
  }
  return recursive;
}

std::set<std::uint32_t> CollectUsedRefs(const Object& root, const object::ReferenceTable& refs) {
  return discover(root, refs).loads;
}

namespace detail {

RewriteResult RewriteRefs(const Object& root, const object::ReferenceTable& refs, const std::set<std::uint32_t>& keep,
                          std::size_t maxDepth) {
  const Discovery found = discover(root, refs);
  const std::size_t budget = found.nodes * kRewriteGrowthFactor + kRewriteSlackNodes;
  Rewriter rewriter(found.targets, keep, maxDepth, budget);
  return rewriter.run(root);
}

}  // namespace detail

}  // namespace pymarshal::refs
