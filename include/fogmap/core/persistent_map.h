#pragma once

#include <array>
#include <bitset>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace fogmap {

// Copy-on-write radix trie keyed by a dense integer index below 2^KeyBits.
// Copies share every node; Set/Erase copy only the path to the touched slot,
// so an update costs O(depth * fanout) no matter how many entries exist.
// Iteration visits entries in ascending index order.
template <typename T, unsigned KeyBits>
class PersistentIndexMap {
 public:
  static constexpr unsigned kBitsPerLevel = 5;
  static constexpr unsigned kFanout = 1u << kBitsPerLevel;
  static constexpr unsigned kLevels = (KeyBits + kBitsPerLevel - 1) / kBitsPerLevel;
  static constexpr uint32_t kCapacity = 1u << KeyBits;

  static_assert(KeyBits > 0 && KeyBits < 32, "KeyBits must be in [1, 31]");

  PersistentIndexMap() = default;

  size_t Size() const { return root_ ? root_->count : 0; }
  bool Empty() const { return Size() == 0; }

  // True when both maps are the same version (not merely equal contents).
  bool SameRoot(const PersistentIndexMap& other) const { return root_ == other.root_; }

  const T* Find(uint32_t index) const {
    if (index >= kCapacity) {
      return nullptr;
    }
    const Node* node = root_.get();
    for (unsigned level = kLevels - 1; node != nullptr && level > 0; --level) {
      node = node->children[SlotOf(index, level)].get();
    }
    if (node == nullptr) {
      return nullptr;
    }
    const unsigned slot = SlotOf(index, 0);
    if (!node->present.test(slot)) {
      return nullptr;
    }
    return &node->values[slot];
  }

  bool Contains(uint32_t index) const { return Find(index) != nullptr; }

  // Returns a new version with `index` bound to `value`. Indices outside the
  // key space leave the map untouched.
  PersistentIndexMap Set(uint32_t index, T value) const {
    if (index >= kCapacity) {
      return *this;
    }
    PersistentIndexMap result;
    result.root_ = SetIn(root_, kLevels - 1, index, std::move(value));
    return result;
  }

  PersistentIndexMap Erase(uint32_t index) const {
    if (!Contains(index)) {
      return *this;
    }
    PersistentIndexMap result;
    result.root_ = EraseIn(root_, kLevels - 1, index);
    return result;
  }

  template <typename Fn>
  void ForEach(Fn&& fn) const {
    if (root_) {
      ForEachIn(*root_, kLevels - 1, 0, fn);
    }
  }

 private:
  struct Node {
    size_t count = 0;
    // Inner nodes use `children`, leaves use `values` + `present`.
    std::vector<std::shared_ptr<const Node>> children;
    std::array<T, kFanout> values{};
    std::bitset<kFanout> present;
  };
  using NodePtr = std::shared_ptr<const Node>;

  static unsigned SlotOf(uint32_t index, unsigned level) {
    return (index >> (level * kBitsPerLevel)) & (kFanout - 1);
  }

  static std::shared_ptr<Node> CloneOrMake(const NodePtr& node, unsigned level) {
    if (node) {
      return std::make_shared<Node>(*node);
    }
    auto fresh = std::make_shared<Node>();
    if (level > 0) {
      fresh->children.resize(kFanout);
    }
    return fresh;
  }

  static NodePtr SetIn(const NodePtr& node, unsigned level, uint32_t index, T value) {
    std::shared_ptr<Node> copy = CloneOrMake(node, level);
    const unsigned slot = SlotOf(index, level);
    if (level == 0) {
      if (!copy->present.test(slot)) {
        copy->present.set(slot);
        ++copy->count;
      }
      copy->values[slot] = std::move(value);
      return copy;
    }
    const NodePtr& child = copy->children[slot];
    const size_t before = child ? child->count : 0;
    NodePtr updated = SetIn(child, level - 1, index, std::move(value));
    copy->count = copy->count - before + updated->count;
    copy->children[slot] = std::move(updated);
    return copy;
  }

  // Precondition: `index` is present below `node`.
  static NodePtr EraseIn(const NodePtr& node, unsigned level, uint32_t index) {
    const unsigned slot = SlotOf(index, level);
    if (node->count == 1) {
      return nullptr;
    }
    std::shared_ptr<Node> copy = std::make_shared<Node>(*node);
    if (level == 0) {
      copy->present.reset(slot);
      copy->values[slot] = T();
      --copy->count;
      return copy;
    }
    copy->children[slot] = EraseIn(node->children[slot], level - 1, index);
    --copy->count;
    return copy;
  }

  template <typename Fn>
  static void ForEachIn(const Node& node, unsigned level, uint32_t prefix, Fn& fn) {
    for (unsigned slot = 0; slot < kFanout; ++slot) {
      const uint32_t index = prefix | (static_cast<uint32_t>(slot) << (level * kBitsPerLevel));
      if (level == 0) {
        if (node.present.test(slot)) {
          fn(index, node.values[slot]);
        }
      } else if (node.children[slot]) {
        ForEachIn(*node.children[slot], level - 1, index, fn);
      }
    }
  }

  NodePtr root_;
};

}  // namespace fogmap
