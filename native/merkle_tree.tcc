/** @file
 *****************************************************************************

 Implementation of interfaces for the native Merkle tree.

 See merkle_tree.hpp

 *****************************************************************************/

#include <stdexcept>

#include "merkle_tree.hpp"

template<typename FieldT>
const size_t native_merkle_tree<FieldT>::max_depth;

template<typename FieldT>
native_merkle_tree<FieldT>::native_merkle_tree(const std::shared_ptr<const poseidon_parameters<FieldT>> &params,
                                               size_t tree_depth,
                                               const std::vector<FieldT> &leaves,
                                               const FieldT &empty_leaf) :
        params(params), tree_depth(tree_depth)
{
    if (!params){
        throw std::invalid_argument("native_merkle_tree: missing hash parameters");
    }
    if (params->arity != 2){
        throw arity_mismatch(2, params->arity, "native_merkle_tree");
    }
    if (tree_depth > max_depth){
        throw std::invalid_argument("native_merkle_tree: depth " + std::to_string(tree_depth) +
                                    " exceeds the maximum depth " + std::to_string(max_depth));
    }
    const size_t capacity = size_t(1) << tree_depth;
    if (leaves.size() > capacity){
        throw std::invalid_argument("native_merkle_tree: " + std::to_string(leaves.size()) +
                                    " leaves do not fit into a tree of depth " + std::to_string(tree_depth));
    }

    layers.resize(tree_depth + 1);
    layers[0] = leaves;
    layers[0].resize(capacity, empty_leaf);
    for (size_t level = 0; level < tree_depth; ++level){
        const std::vector<FieldT> &below = layers[level];
        layers[level + 1].reserve(below.size() / 2);
        for (size_t i = 0; i < below.size(); i += 2){
            layers[level + 1].emplace_back(poseidon_crh(*params, {below[i], below[i + 1]}));
        }
    }
}

template<typename FieldT>
size_t native_merkle_tree<FieldT>::depth() const
{
    return tree_depth;
}

template<typename FieldT>
size_t native_merkle_tree<FieldT>::num_leaves() const
{
    return layers[0].size();
}

template<typename FieldT>
const FieldT &native_merkle_tree<FieldT>::root() const
{
    return layers[tree_depth][0];
}

template<typename FieldT>
const FieldT &native_merkle_tree<FieldT>::leaf(size_t index) const
{
    return layers[0].at(index);
}

template<typename FieldT>
std::vector<native_merkle_path_level<FieldT>> native_merkle_tree<FieldT>::authentication_path(size_t index) const
{
    if (index >= num_leaves()){
        throw std::out_of_range("native_merkle_tree: leaf index " + std::to_string(index) + " out of range");
    }
    std::vector<native_merkle_path_level<FieldT>> path;
    path.reserve(tree_depth);
    size_t position = index;
    for (size_t level = 0; level < tree_depth; ++level){
        native_merkle_path_level<FieldT> step;
        step.sibling = layers[level][position ^ 1];
        step.direction = (position & 1) == 1;
        path.push_back(step);
        position >>= 1;
    }
    return path;
}

template<typename FieldT>
FieldT native_merkle_root_from_path(const poseidon_parameters<FieldT> &params,
                                    const FieldT &leaf,
                                    const std::vector<native_merkle_path_level<FieldT>> &path)
{
    FieldT current = leaf;
    for (size_t i = 0; i < path.size(); ++i){
        if (path[i].direction){
            current = poseidon_crh(params, {path[i].sibling, current});
        } else {
            current = poseidon_crh(params, {current, path[i].sibling});
        }
    }
    return current;
}

template<typename FieldT>
bool native_verify_membership(const poseidon_parameters<FieldT> &params,
                              const FieldT &leaf,
                              const std::vector<native_merkle_path_level<FieldT>> &path,
                              const FieldT &root)
{
    return native_merkle_root_from_path(params, leaf, path) == root;
}
