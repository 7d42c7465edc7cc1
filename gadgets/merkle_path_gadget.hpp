/** @file
 *****************************************************************************

 Declaration of interfaces for the Merkle path gadget

 merkle_path_gadget: proves that leaf is a member of the binary Merkle tree
 with root claimed_root, given the authentication path. Per level:

   left    = current + direction * (sibling - current)   (field_select_gadget)
   right   = current + sibling - left                     (linear)
   current = CRH(left, right)                             (poseidon_crh_gadget)

 and result() is the boolean current == claimed_root. A wrong path gives a
 false result, the gadget never asserts it. The constraint system depends on
 the modes of the inputs only, never on the direction values.

 verify_membership: builds the gadget for path.size() levels and generates
 its constraints and witness.
 *****************************************************************************/

#ifndef MERKLE_PATH_GADGET_H
#define MERKLE_PATH_GADGET_H

#include <memory>
#include <vector>

#include "libsnark/gadgetlib1/gadget.hpp"
#include "libsnark/gadgetlib1/protoboard.hpp"

#include "gadgets/field_gadgets.hpp"
#include "gadgets/merkle_path_variables.hpp"
#include "gadgets/poseidon_crh_gadget.hpp"

template<typename FieldT>
class merkle_path_gadget : public libsnark::gadget<FieldT> {
private:
    std::vector<std::shared_ptr<field_select_gadget<FieldT> > > selectors;
    std::vector<std::shared_ptr<poseidon_crh_gadget<FieldT> > > hashers;
    std::shared_ptr<field_equality_gadget<FieldT> > root_check;
    field_value<FieldT> root;
    boolean_value<FieldT> is_member;

public:
    const std::shared_ptr<const poseidon_parameters<FieldT> > params;
    const size_t tree_depth;
    const field_value<FieldT> leaf;
    const std::vector<merkle_path_level<FieldT> > path;
    const field_value<FieldT> claimed_root;

    /**
     * Throws std::invalid_argument for missing parameters or
     * path.size() != tree_depth, arity_mismatch if params is not arity 2
     */
    merkle_path_gadget(libsnark::protoboard<FieldT> &pb,
                       const std::shared_ptr<const poseidon_parameters<FieldT> > &params,
                       const size_t tree_depth,
                       const field_value<FieldT> &leaf,
                       const std::vector<merkle_path_level<FieldT> > &path,
                       const field_value<FieldT> &claimed_root,
                       const std::string &annotation_prefix="");

    void generate_r1cs_constraints();
    void generate_r1cs_witness();

    const field_value<FieldT> &computed_root() const;
    const boolean_value<FieldT> &result() const;
};

template<typename FieldT>
boolean_value<FieldT> verify_membership(libsnark::protoboard<FieldT> &pb,
                                        const std::shared_ptr<const poseidon_parameters<FieldT> > &params,
                                        const field_value<FieldT> &leaf,
                                        const std::vector<merkle_path_level<FieldT> > &path,
                                        const field_value<FieldT> &claimed_root,
                                        const std::string &annotation_prefix="membership");

#include "merkle_path_gadget.tcc"

#endif //MERKLE_PATH_GADGET_H
