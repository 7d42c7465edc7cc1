/** @file
 *****************************************************************************

 Implementation of interfaces for Poseidon gadgets.

 See poseidon_crh_gadget.hpp

 *****************************************************************************/

#include <stdexcept>

#include "gadgets/utils.h"
#include "poseidon_crh_gadget.hpp"

template<typename FieldT>
poseidon_permutation_gadget<FieldT>::poseidon_permutation_gadget(libsnark::protoboard<FieldT> &pb,
                                                                 const std::shared_ptr<const poseidon_parameters<FieldT> > &params,
                                                                 const std::vector<field_value<FieldT> > &initial_state,
                                                                 const std::string &annotation_prefix) :
        libsnark::gadget<FieldT>(pb, annotation_prefix), params(params), initial_state(initial_state)
{
    if (!params){
        throw std::invalid_argument(this->annotation_prefix + ": missing hash parameters");
    }
    if (initial_state.size() != params->width){
        throw arity_mismatch(params->width, initial_state.size(), this->annotation_prefix);
    }

    state = initial_state;
    std::vector<field_value<FieldT> > mixed(params->width);
    for (size_t round = 0; round < params->num_rounds(); ++round){
        for (size_t i = 0; i < params->width; ++i){
            state[i] = state[i] + params->round_constant(round, i);
        }
        if (params->is_full_round(round)){
            for (size_t i = 0; i < params->width; ++i){
                state[i] = sbox(state[i], round, i);
            }
        } else {
            state[0] = sbox(state[0], round, 0);
        }
        for (size_t i = 0; i < params->width; ++i){
            mixed[i] = field_value<FieldT>();
            for (size_t j = 0; j < params->width; ++j){
                mixed[i] = mixed[i] + params->mds[i][j] * state[j];
            }
        }
        state.swap(mixed);
    }
}

template<typename FieldT>
field_value<FieldT> poseidon_permutation_gadget<FieldT>::multiply(const field_value<FieldT> &a,
                                                                  const field_value<FieldT> &b,
                                                                  const std::string &annotation)
{
    products.emplace_back(new field_multiplication_gadget<FieldT>(this->pb, a, b, annotation));
    return products.back()->result();
}

template<typename FieldT>
field_value<FieldT> poseidon_permutation_gadget<FieldT>::sbox(const field_value<FieldT> &x, size_t round, size_t i)
{
    if (x.is_constant()){
        return field_value<FieldT>::constant(poseidon_sbox(x.constant_value(), params->alpha));
    }
    // square-and-multiply over the bits of alpha, most significant first
    field_value<FieldT> acc = x;
    for (int bit = num_bits(params->alpha) - 2; bit >= 0; --bit){
        acc = multiply(acc, acc, FMT(this->annotation_prefix, " round %zu sbox %zu square %d", round, i, bit));
        if ((params->alpha >> bit) & 1){
            acc = multiply(acc, x, FMT(this->annotation_prefix, " round %zu sbox %zu multiply %d", round, i, bit));
        }
    }
    return acc;
}

template<typename FieldT>
void poseidon_permutation_gadget<FieldT>::generate_r1cs_constraints()
{
    for (size_t i = 0; i < products.size(); ++i){
        products[i]->generate_r1cs_constraints();
    }
}

template<typename FieldT>
void poseidon_permutation_gadget<FieldT>::generate_r1cs_witness()
{
    for (size_t i = 0; i < products.size(); ++i){
        products[i]->generate_r1cs_witness();
    }
}

template<typename FieldT>
const std::vector<field_value<FieldT> > &poseidon_permutation_gadget<FieldT>::result() const
{
    return state;
}

template<typename FieldT>
poseidon_crh_gadget<FieldT>::poseidon_crh_gadget(libsnark::protoboard<FieldT> &pb,
                                                 const std::shared_ptr<const poseidon_parameters<FieldT> > &params,
                                                 const std::vector<field_value<FieldT> > &inputs,
                                                 const std::string &annotation_prefix) :
        libsnark::gadget<FieldT>(pb, annotation_prefix), params(params), inputs(inputs)
{
    if (!params){
        throw std::invalid_argument(this->annotation_prefix + ": missing hash parameters");
    }
    if (inputs.size() != params->arity){
        throw arity_mismatch(params->arity, inputs.size(), this->annotation_prefix);
    }

    std::vector<field_value<FieldT> > initial_state;
    std::vector<circuit_mode> modes;
    initial_state.reserve(params->width);
    initial_state.emplace_back(field_value<FieldT>::constant(FieldT::zero()));
    for (size_t i = 0; i < inputs.size(); ++i){
        initial_state.emplace_back(inputs[i]);
        modes.emplace_back(inputs[i].mode);
    }

    permutation.reset(new poseidon_permutation_gadget<FieldT>(pb, params, initial_state,
                                                              FMT(this->annotation_prefix, " permutation")));
    output = field_value<FieldT>(combine_modes(modes), permutation->result()[1].lc);
}

template<typename FieldT>
void poseidon_crh_gadget<FieldT>::generate_r1cs_constraints()
{
    permutation->generate_r1cs_constraints();
}

template<typename FieldT>
void poseidon_crh_gadget<FieldT>::generate_r1cs_witness()
{
    permutation->generate_r1cs_witness();
}

template<typename FieldT>
const field_value<FieldT> &poseidon_crh_gadget<FieldT>::result() const
{
    return output;
}

template<typename FieldT>
poseidon_sponge_gadget<FieldT>::poseidon_sponge_gadget(libsnark::protoboard<FieldT> &pb,
                                                       const std::shared_ptr<const poseidon_parameters<FieldT> > &params,
                                                       const std::vector<field_value<FieldT> > &inputs,
                                                       const std::string &annotation_prefix) :
        libsnark::gadget<FieldT>(pb, annotation_prefix), params(params), inputs(inputs)
{
    if (!params){
        throw std::invalid_argument(this->annotation_prefix + ": missing hash parameters");
    }

    const std::vector<field_value<FieldT> > padded =
            pad_sponge_input(inputs, params->arity,
                             field_value<FieldT>::constant(FieldT::one()),
                             field_value<FieldT>::constant(FieldT::zero()));

    std::vector<field_value<FieldT> > state(params->width);
    state[0] = field_value<FieldT>::constant(FieldT::one());
    for (size_t offset = 0; offset < padded.size(); offset += params->arity){
        for (size_t i = 0; i < params->arity; ++i){
            state[1 + i] = state[1 + i] + padded[offset + i];
        }
        permutations.emplace_back(new poseidon_permutation_gadget<FieldT>(pb, params, state,
                                                                          FMT(this->annotation_prefix, " chunk %zu", offset / params->arity)));
        state = permutations.back()->result();
    }

    std::vector<circuit_mode> modes;
    for (size_t i = 0; i < inputs.size(); ++i){
        modes.emplace_back(inputs[i].mode);
    }
    output = field_value<FieldT>(combine_modes(modes), state[1].lc);
}

template<typename FieldT>
void poseidon_sponge_gadget<FieldT>::generate_r1cs_constraints()
{
    for (size_t i = 0; i < permutations.size(); ++i){
        permutations[i]->generate_r1cs_constraints();
    }
}

template<typename FieldT>
void poseidon_sponge_gadget<FieldT>::generate_r1cs_witness()
{
    for (size_t i = 0; i < permutations.size(); ++i){
        permutations[i]->generate_r1cs_witness();
    }
}

template<typename FieldT>
const field_value<FieldT> &poseidon_sponge_gadget<FieldT>::result() const
{
    return output;
}

template<typename FieldT>
field_value<FieldT> crh_hash(libsnark::protoboard<FieldT> &pb,
                             const std::shared_ptr<const poseidon_parameters<FieldT> > &params,
                             const std::vector<field_value<FieldT> > &inputs,
                             const std::string &annotation_prefix)
{
    poseidon_crh_gadget<FieldT> hasher(pb, params, inputs, annotation_prefix);
    hasher.generate_r1cs_constraints();
    hasher.generate_r1cs_witness();
    return hasher.result();
}

template<typename FieldT>
field_value<FieldT> sponge_hash(libsnark::protoboard<FieldT> &pb,
                                const std::shared_ptr<const poseidon_parameters<FieldT> > &params,
                                const std::vector<field_value<FieldT> > &inputs,
                                const std::string &annotation_prefix)
{
    poseidon_sponge_gadget<FieldT> hasher(pb, params, inputs, annotation_prefix);
    hasher.generate_r1cs_constraints();
    hasher.generate_r1cs_witness();
    return hasher.result();
}
