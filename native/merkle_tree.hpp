/** @file
 *****************************************************************************

 Declaration of interfaces for the native Merkle tree

 native_merkle_tree: a complete binary tree of fixed depth over field
 elements, inner nodes are poseidon_crh(left, right) with an arity 2
 parameter set. Missing leaves are filled with empty_leaf.

 An authentication path lists one level per tree layer, leaf to root.
 direction == false: the current node is the left child, the sibling is
 the right child. direction == true: the reverse.
 *****************************************************************************/

#ifndef NATIVE_MERKLE_TREE_H
#define NATIVE_MERKLE_TREE_H

#include <memory>
#include <vector>

#include "native/poseidon_hash.hpp"

template<typename FieldT>
struct native_merkle_path_level {
    FieldT sibling;
    bool direction;
};

template<typename FieldT>
class native_merkle_tree {
private:
    std::shared_ptr<const poseidon_parameters<FieldT>> params;
    size_t tree_depth;
    // layers[0] are the leaves, layers[tree_depth] holds the root
    std::vector<std::vector<FieldT>> layers;

public:
    // all 2^depth leaves are stored, deeper trees do not fit into memory
    static const size_t max_depth = 24;

    /**
     * Throws std::invalid_argument for missing parameters, too many leaves
     * or depth > max_depth, arity_mismatch if params is not arity 2
     */
    native_merkle_tree(const std::shared_ptr<const poseidon_parameters<FieldT>> &params,
                       size_t tree_depth,
                       const std::vector<FieldT> &leaves,
                       const FieldT &empty_leaf=FieldT::zero());

    size_t depth() const;
    size_t num_leaves() const;
    const FieldT &root() const;
    const FieldT &leaf(size_t index) const;

    // throws std::out_of_range if index >= num_leaves()
    std::vector<native_merkle_path_level<FieldT>> authentication_path(size_t index) const;
};

template<typename FieldT>
FieldT native_merkle_root_from_path(const poseidon_parameters<FieldT> &params,
                                    const FieldT &leaf,
                                    const std::vector<native_merkle_path_level<FieldT>> &path);

template<typename FieldT>
bool native_verify_membership(const poseidon_parameters<FieldT> &params,
                              const FieldT &leaf,
                              const std::vector<native_merkle_path_level<FieldT>> &path,
                              const FieldT &root);

#include "merkle_tree.tcc"

#endif //NATIVE_MERKLE_TREE_H
