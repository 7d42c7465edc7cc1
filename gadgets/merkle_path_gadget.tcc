/** @file
 *****************************************************************************

 Implementation of interfaces for the Merkle path gadget.

 See merkle_path_gadget.hpp

 *****************************************************************************/

#include <stdexcept>

#include "merkle_path_gadget.hpp"

template<typename FieldT>
merkle_path_gadget<FieldT>::merkle_path_gadget(libsnark::protoboard<FieldT> &pb,
                                               const std::shared_ptr<const poseidon_parameters<FieldT> > &params,
                                               const size_t tree_depth,
                                               const field_value<FieldT> &leaf,
                                               const std::vector<merkle_path_level<FieldT> > &path,
                                               const field_value<FieldT> &claimed_root,
                                               const std::string &annotation_prefix) :
        libsnark::gadget<FieldT>(pb, annotation_prefix), params(params), tree_depth(tree_depth),
        leaf(leaf), path(path), claimed_root(claimed_root)
{
    if (!params){
        throw std::invalid_argument(this->annotation_prefix + ": missing hash parameters");
    }
    if (params->arity != 2){
        throw arity_mismatch(2, params->arity, this->annotation_prefix);
    }
    if (path.size() != tree_depth){
        throw std::invalid_argument(this->annotation_prefix + ": path has " + std::to_string(path.size()) +
                                    " levels, tree depth is " + std::to_string(tree_depth));
    }

    std::vector<circuit_mode> modes;
    modes.push_back(leaf.mode);
    modes.push_back(claimed_root.mode);

    field_value<FieldT> current = leaf;
    for (size_t i = 0; i < tree_depth; ++i){
        const field_value<FieldT> &sibling = path[i].sibling;
        const boolean_value<FieldT> &direction = path[i].direction;
        modes.push_back(sibling.mode);
        modes.push_back(direction.mode);

        selectors.emplace_back(new field_select_gadget<FieldT>(pb, direction, current, sibling,
                                                               FMT(this->annotation_prefix, " level %zu select", i)));
        const field_value<FieldT> left = selectors.back()->result();
        const field_value<FieldT> right = current + sibling - left;

        hashers.emplace_back(new poseidon_crh_gadget<FieldT>(pb, params, {left, right},
                                                             FMT(this->annotation_prefix, " level %zu hash", i)));
        current = hashers.back()->result();
    }
    root = current;

    root_check.reset(new field_equality_gadget<FieldT>(pb, root, claimed_root,
                                                       FMT(this->annotation_prefix, " root check")));
    is_member = boolean_value<FieldT>(combine_modes(modes), root_check->result().lc);
}

template<typename FieldT>
void merkle_path_gadget<FieldT>::generate_r1cs_constraints()
{
    for (size_t i = 0; i < tree_depth; ++i){
        selectors[i]->generate_r1cs_constraints();
        hashers[i]->generate_r1cs_constraints();
    }
    root_check->generate_r1cs_constraints();
}

template<typename FieldT>
void merkle_path_gadget<FieldT>::generate_r1cs_witness()
{
    for (size_t i = 0; i < tree_depth; ++i){
        selectors[i]->generate_r1cs_witness();
        hashers[i]->generate_r1cs_witness();
    }
    root_check->generate_r1cs_witness();
}

template<typename FieldT>
const field_value<FieldT> &merkle_path_gadget<FieldT>::computed_root() const
{
    return root;
}

template<typename FieldT>
const boolean_value<FieldT> &merkle_path_gadget<FieldT>::result() const
{
    return is_member;
}

template<typename FieldT>
boolean_value<FieldT> verify_membership(libsnark::protoboard<FieldT> &pb,
                                        const std::shared_ptr<const poseidon_parameters<FieldT> > &params,
                                        const field_value<FieldT> &leaf,
                                        const std::vector<merkle_path_level<FieldT> > &path,
                                        const field_value<FieldT> &claimed_root,
                                        const std::string &annotation_prefix)
{
    merkle_path_gadget<FieldT> membership(pb, params, path.size(), leaf, path, claimed_root, annotation_prefix);
    membership.generate_r1cs_constraints();
    membership.generate_r1cs_witness();
    return membership.result();
}
