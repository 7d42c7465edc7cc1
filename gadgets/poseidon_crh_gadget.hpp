/** @file
 *****************************************************************************

 Declaration of interfaces for Poseidon gadgets

 poseidon_permutation_gadget: the Poseidon permutation over a state of
 params->width circuit values. Round constants and the MDS layer are linear,
 each S-box costs the multiplications of its square-and-multiply chain.
 S-boxes on Constant values are computed natively.

 poseidon_crh_gadget: fixed arity collision-resistant hash,
 state = [0, inputs...], result is state element 1 after one permutation

 poseidon_sponge_gadget: variable length hash, capacity initialized to 1,
 input padded with a single 1 and zeros, absorbed arity elements at a time

 The result mode of both hashes is the combination of the input modes.
 Inputs of Constant mode only yield a Constant result and zero constraints.
 Native counterparts are in native/poseidon_hash.hpp.
 *****************************************************************************/

#ifndef POSEIDON_CRH_GADGET_H
#define POSEIDON_CRH_GADGET_H

#include <memory>
#include <vector>

#include "libsnark/gadgetlib1/gadget.hpp"
#include "libsnark/gadgetlib1/protoboard.hpp"

#include "circuit/circuit_errors.hpp"
#include "circuit/field_value.hpp"
#include "gadgets/field_gadgets.hpp"
#include "native/poseidon_hash.hpp"

template<typename FieldT>
class poseidon_permutation_gadget : public libsnark::gadget<FieldT> {
private:
    std::vector<std::shared_ptr<field_multiplication_gadget<FieldT> > > products;
    std::vector<field_value<FieldT> > state;

    field_value<FieldT> multiply(const field_value<FieldT> &a, const field_value<FieldT> &b, const std::string &annotation);
    field_value<FieldT> sbox(const field_value<FieldT> &x, size_t round, size_t i);

public:
    const std::shared_ptr<const poseidon_parameters<FieldT> > params;
    const std::vector<field_value<FieldT> > initial_state;

    poseidon_permutation_gadget(libsnark::protoboard<FieldT> &pb,
                                const std::shared_ptr<const poseidon_parameters<FieldT> > &params,
                                const std::vector<field_value<FieldT> > &initial_state,
                                const std::string &annotation_prefix="");

    void generate_r1cs_constraints();
    void generate_r1cs_witness();

    const std::vector<field_value<FieldT> > &result() const;
};

template<typename FieldT>
class poseidon_crh_gadget : public libsnark::gadget<FieldT> {
private:
    std::shared_ptr<poseidon_permutation_gadget<FieldT> > permutation;
    field_value<FieldT> output;

public:
    const std::shared_ptr<const poseidon_parameters<FieldT> > params;
    const std::vector<field_value<FieldT> > inputs;

    /**
     * Throws std::invalid_argument for missing parameters and
     * arity_mismatch if inputs.size() != params->arity
     */
    poseidon_crh_gadget(libsnark::protoboard<FieldT> &pb,
                        const std::shared_ptr<const poseidon_parameters<FieldT> > &params,
                        const std::vector<field_value<FieldT> > &inputs,
                        const std::string &annotation_prefix="");

    void generate_r1cs_constraints();
    void generate_r1cs_witness();

    const field_value<FieldT> &result() const;
};

template<typename FieldT>
class poseidon_sponge_gadget : public libsnark::gadget<FieldT> {
private:
    std::vector<std::shared_ptr<poseidon_permutation_gadget<FieldT> > > permutations;
    field_value<FieldT> output;

public:
    const std::shared_ptr<const poseidon_parameters<FieldT> > params;
    const std::vector<field_value<FieldT> > inputs;

    // throws std::invalid_argument for missing parameters
    poseidon_sponge_gadget(libsnark::protoboard<FieldT> &pb,
                           const std::shared_ptr<const poseidon_parameters<FieldT> > &params,
                           const std::vector<field_value<FieldT> > &inputs,
                           const std::string &annotation_prefix="");

    void generate_r1cs_constraints();
    void generate_r1cs_witness();

    const field_value<FieldT> &result() const;
};

// builds a poseidon_crh_gadget, generates its constraints and witness
template<typename FieldT>
field_value<FieldT> crh_hash(libsnark::protoboard<FieldT> &pb,
                             const std::shared_ptr<const poseidon_parameters<FieldT> > &params,
                             const std::vector<field_value<FieldT> > &inputs,
                             const std::string &annotation_prefix="crh");

template<typename FieldT>
field_value<FieldT> sponge_hash(libsnark::protoboard<FieldT> &pb,
                                const std::shared_ptr<const poseidon_parameters<FieldT> > &params,
                                const std::vector<field_value<FieldT> > &inputs,
                                const std::string &annotation_prefix="sponge");

#include "poseidon_crh_gadget.tcc"

#endif //POSEIDON_CRH_GADGET_H
