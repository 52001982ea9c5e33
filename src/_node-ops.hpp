#pragma once

#include "_base-node-ops.hpp"

#include <array>
#include <new>
#include <utility>

namespace pvec::detail {

// ----------------------------------------------------------------------------------------- NodeOps

/**
 * The trie engine. Operates on raw node pointers whose lifetime is managed by
 * the intrusive reference count in each node header.
 *
 * Conventions:
 *  - "level" is the shift of a node: the root sits at `shift`, leaves sit at 0.
 *  - A function that returns a node_ptr_type hands one reference to the caller.
 *  - A function that takes a node_ptr_type to store into a new node takes over
 *    the caller's reference, unless documented otherwise.
 */
template <typename T, bool IsThreadSafe = true> struct NodeOps {
  using item_type = T;
  using node_type = NodeData<IsThreadSafe>;
  using node_ptr_type = node_type*;
  using node_const_ptr_type = const node_type*;
  using size_type = std::size_t;
  using node_size_type = typename node_type::node_size_type;
  using ref_count_type = typename node_type::ref_count_type;

  using Branch = BranchNodeOps<IsThreadSafe>;
  using Leaf = LeafNodeOps<item_type, IsThreadSafe>;

  static constexpr bool is_thread_safe = IsThreadSafe;

  static constexpr void destroy(node_ptr_type node_ptr) {
    if (node_ptr == nullptr) {
      return;
    }

    if (node_ptr->type() == NodeType::Branch) {
      node_ptr_type* iterator = Branch::ptr_at(node_ptr, 0); // i.e., node_type**
      node_ptr_type* end = iterator + Branch::size(node_ptr);
      while (iterator != end) {
        node_ptr_type node_ptr = *iterator++;
        dec_ref(node_ptr);
      }
    } else {
      Leaf::destroy_items(node_ptr, static_cast<node_size_type>(Leaf::size(node_ptr)));
    }

    node_ptr->~node_type();
    std::free(node_ptr);
  }

  //@{ Getters
  static constexpr NodeType type(node_const_ptr_type node) { return node->type(); }

  static constexpr size_type size(node_const_ptr_type node) {
    return (node == nullptr) ? 0 : node->size();
  }
  //@}

  //@{ Reference counting
  static constexpr node_ptr_type add_ref(node_ptr_type node) {
    if (node != nullptr)
      node->add_ref();
    return node;
  }
  static constexpr void dec_ref(node_const_ptr_type node) {
    if (node != nullptr && node->dec_ref() == 0)
      destroy(const_cast<node_ptr_type>(node));
  }
  static constexpr ref_count_type ref_count(node_const_ptr_type node) {
    return (node == nullptr) ? 0 : node->ref_count();
  }
  //@}

  //@{ Read
  static constexpr node_ptr_type child_at(node_const_ptr_type node, uint32_t slot) {
    assert(type(node) == NodeType::Branch);
    assert(Branch::is_valid_index(node, slot));
    return *Branch::ptr_at(node, slot);
  }

  /**
   * Walks from `root` (at level `shift`) down to the leaf that holds `position`
   */
  static constexpr node_ptr_type find_leaf(node_ptr_type root, uint32_t shift,
                                           size_type position) {
    auto node = root;
    for (auto level = shift; level > 0; level -= BranchBits)
      node = child_at(node, selector(position, level));
    assert(type(node) == NodeType::Leaf);
    return node;
  }

  /**
   * The leftmost leaf beneath `node`, which sits at `level`
   */
  static constexpr node_ptr_type leftmost_leaf(node_ptr_type node, uint32_t level) {
    for (; level > 0; level -= BranchBits)
      node = child_at(node, 0);
    assert(type(node) == NodeType::Leaf);
    return node;
  }
  //@}

  //@{ Path
  struct TreePath {
    std::array<node_ptr_type, MaxTrieDepth> nodes; //!< the path is {Branch, Branch, Branch}
    node_ptr_type leaf_end = nullptr;              //!< set if the path ends in a leaf
    uint32_t size = 0;                             //!< number of branch elements in path
    void push(node_ptr_type node) {
      assert(size < nodes.size());
      nodes[size++] = node;
    }
  };

  static constexpr uint32_t level_at_depth(uint32_t shift, uint32_t depth) {
    assert(depth * BranchBits <= shift);
    return shift - depth * BranchBits;
  }

  /**
   * Records the branch nodes from `root` towards `position`. The walk stops early
   * if the path does not exist yet, in which case `leaf_end` is null.
   */
  static constexpr TreePath make_path(node_ptr_type root, uint32_t shift, size_type position) {
    TreePath path;
    auto node = root;
    for (auto level = shift; node != nullptr && level > 0; level -= BranchBits) {
      path.push(node);
      const auto slot = selector(position, level);
      node = Branch::is_valid_index(node, slot) ? *Branch::ptr_at(node, slot) : nullptr;
    }
    path.leaf_end = node;
    assert(path.leaf_end == nullptr || type(path.leaf_end) == NodeType::Leaf);
    return path;
  }

  /**
   * Copies the first `depth` branch nodes of `path`, bottom up, each copy having the
   * slot towards `position` redirected to the copy beneath it. `splice_node` is
   * what the deepest copy points to, and its reference is taken over.
   *
   *    path:     root -> B -> B -> [old]
   *    result:   root' -> B' -> B' -> splice_node
   *
   * Siblings of every copied node are shared with the source path. If an allocation
   * fails, then `splice_node` and the copies made so far are released.
   *
   * @return The new root of the tree
   */
  static constexpr node_ptr_type rewrite_and_attach(const TreePath& path, uint32_t shift,
                                                    size_type position, uint32_t depth,
                                                    node_ptr_type splice_node) {
    auto iterator = splice_node;
    try {
      for (auto i = depth; i > 0; --i) {
        auto* node = path.nodes[i - 1];
        const auto slot = selector(position, level_at_depth(shift, i - 1)); // Overwrite position
        iterator = Branch::duplicate_with(node, slot, iterator); // Private copy, with overwrite
      }
    } catch (const std::bad_alloc&) {
      dec_ref(iterator);
      throw;
    }
    return iterator;
  }

  /**
   * Wraps `node` in single-child branches until it sits at `level`
   *
   *    new_path(10, leaf)  ==>  B -> B -> leaf
   *
   * Takes over the reference to `node`, which is released along with the partial
   * path if an allocation fails.
   */
  static constexpr node_ptr_type new_path(uint32_t level, node_ptr_type node) {
    try {
      for (; level > 0; level -= BranchBits)
        node = Branch::make(node);
    } catch (const std::bad_alloc&) {
      dec_ref(node);
      throw;
    }
    return node;
  }
  //@}

  //@{ Persistent operations: the nodes passed in are never modified

  /**
   * Path copies the trie so that `position` holds `value`
   * @return The new root
   */
  template <typename Value>
  static constexpr node_ptr_type assoc(node_ptr_type root, uint32_t shift, size_type position,
                                       Value&& value) {
    const auto path = make_path(root, shift, position);
    assert(path.leaf_end != nullptr);
    auto new_leaf = Leaf::duplicate_with_overwrite(path.leaf_end, selector(position, 0),
                                                   std::forward<Value>(value));
    return rewrite_and_attach(path, shift, position, path.size, new_leaf);
  }

  /**
   * Inserts the full `tail` as the leaf starting at `position`, where the trie rooted at
   * `root` has room for it. The tail is shared, not copied.
   * @return The new root
   */
  static constexpr node_ptr_type push_leaf(node_ptr_type root, uint32_t shift, size_type position,
                                           node_ptr_type tail) {
    assert(Leaf::is_full(tail));
    const auto path = make_path(root, shift, position);
    assert(path.leaf_end == nullptr);
    assert(path.size > 0);
    // The last node on the path has no child towards `position`, so the
    // new subtree hangs just below it
    const auto child_level = level_at_depth(shift, path.size - 1) - BranchBits;
    auto subtree = new_path(child_level, add_ref(tail));
    return rewrite_and_attach(path, shift, position, path.size, subtree);
  }

  /**
   * Grows the trie by one level: {root, new-path -> tail}. Both are shared.
   * @return The new root, which sits at `shift + 5`
   */
  static constexpr node_ptr_type grow(node_ptr_type root, uint32_t shift, node_ptr_type tail) {
    assert(shift + BranchBits <= MaxShift);
    auto right = new_path(shift, add_ref(tail));
    node_ptr_type grown = nullptr;
    try {
      grown = Branch::make(root, right);
    } catch (const std::bad_alloc&) {
      dec_ref(right);
      throw;
    }
    add_ref(root);
    return grown;
  }

  /**
   * Removes the rightmost leaf, which starts at `position`, from the trie.
   * @return {new root, removed leaf}; both references are handed to the caller
   */
  static constexpr std::pair<node_ptr_type, node_ptr_type>
  pop_leaf(node_ptr_type root, uint32_t shift, size_type position) {
    assert(position > 0);
    assert(shift > 0);
    const auto path = make_path(root, shift, position);
    assert(path.leaf_end != nullptr);

    // Nodes below the divergence level only lead to the removed leaf
    const auto level = divergence_level(position, shift);
    const auto depth = (shift - level) / BranchBits;
    auto* ancestor = path.nodes[depth];
    assert(selector(position, level) + 1 == Branch::size(ancestor));
    auto trimmed = Branch::duplicate_without_last(ancestor);
    return {rewrite_and_attach(path, shift, position, depth, trimmed), add_ref(path.leaf_end)};
  }
  //@}

  //@{ Transient operations: nodes are edited in place when not shared

  /**
   * Makes `*slot` safe to edit: if the node is shared, it is replaced by a private copy
   * @return The (possibly new) node in `*slot`
   */
  static constexpr node_ptr_type ensure_editable(node_ptr_type* slot) {
    auto node = *slot;
    assert(node != nullptr);
    if (node->is_unique())
      return node;
    auto copy = (type(node) == NodeType::Branch) ? Branch::duplicate(node) : Leaf::duplicate(node);
    dec_ref(node); // cannot reach zero, it was shared
    *slot = copy;
    return copy;
  }

  /**
   * Makes the path from `*root` to the leaf holding `position` editable
   * @return The leaf, editable in place
   */
  static constexpr node_ptr_type editable_leaf(node_ptr_type* root, uint32_t shift,
                                               size_type position) {
    auto node = ensure_editable(root);
    for (auto level = shift; level > 0; level -= BranchBits) {
      auto* slot = Branch::ptr_at(node, selector(position, level));
      node = ensure_editable(slot);
    }
    return node;
  }

  template <typename Value>
  static constexpr void transient_assoc(node_ptr_type* root, uint32_t shift, size_type position,
                                        Value&& value) {
    const auto index = selector(position, 0);
    if constexpr (std::is_assignable<item_type&, Value&&>::value) {
      auto leaf = editable_leaf(root, shift, position);
      Leaf::overwrite(leaf, index, std::forward<Value>(value));
    } else {
      // Cannot assign: build the replacement leaf first, then swap it in
      auto old_leaf = find_leaf(*root, shift, position);
      auto new_leaf = Leaf::duplicate_with_overwrite(old_leaf, index, std::forward<Value>(value));
      auto* slot = root;
      try {
        for (auto level = shift; level > 0; level -= BranchBits) {
          auto node = ensure_editable(slot);
          slot = Branch::ptr_at(node, selector(position, level));
        }
      } catch (const std::bad_alloc&) {
        dec_ref(new_leaf);
        throw;
      }
      dec_ref(*slot);
      *slot = new_leaf;
    }
  }

  /**
   * Places `tail` in the trie at `position`. The trie takes its own reference, so
   * the caller's reference is untouched whether or not this throws.
   */
  static constexpr void transient_push_leaf(node_ptr_type* root, uint32_t shift,
                                            size_type position, node_ptr_type tail) {
    auto node = ensure_editable(root);
    for (auto level = shift; level > BranchBits; level -= BranchBits) {
      const auto slot = selector(position, level);
      if (!Branch::is_valid_index(node, slot)) {
        assert(slot == Branch::size(node));
        Branch::append(node, new_path(level - BranchBits, add_ref(tail)));
        return;
      }
      node = ensure_editable(Branch::ptr_at(node, slot));
    }
    assert(selector(position, BranchBits) == Branch::size(node));
    Branch::append(node, add_ref(tail));
  }

  /**
   * Detaches the rightmost leaf, which starts at `position`
   * @return The removed leaf; its reference is handed to the caller
   */
  static constexpr node_ptr_type transient_pop_leaf(node_ptr_type* root, uint32_t shift,
                                                    size_type position) {
    assert(position > 0);
    assert(shift > 0);
    const auto divergence = divergence_level(position, shift);
    auto node = ensure_editable(root);
    for (auto level = shift; level > divergence; level -= BranchBits)
      node = ensure_editable(Branch::ptr_at(node, selector(position, level)));

    assert(selector(position, divergence) + 1 == Branch::size(node));
    auto subtree = Branch::remove_last(node);
    auto leaf = add_ref(leftmost_leaf(subtree, divergence - BranchBits));
    dec_ref(subtree);
    return leaf;
  }
  //@}
};

} // namespace pvec::detail
