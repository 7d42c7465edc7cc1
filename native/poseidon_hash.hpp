/** @file
 *****************************************************************************

 Declaration of interfaces for the native Poseidon hash

 poseidon_permutation: applies all rounds to a state of params.width elements

 poseidon_crh: fixed arity compression, state = [0, inputs...],
 output is state element 1 after one permutation

 poseidon_sponge: variable length hash, capacity initialized to 1, input
 padded with a single 1 and zeros to a multiple of the arity, absorbed
 chunk by chunk; output is state element 1

 The gadgets in gadgets/poseidon_gadget.hpp compute the same functions.
 *****************************************************************************/

#ifndef POSEIDON_HASH_H
#define POSEIDON_HASH_H

#include <vector>

#include "circuit/circuit_errors.hpp"
#include "native/poseidon_parameters.hpp"

template<typename FieldT>
FieldT poseidon_sbox(const FieldT &x, size_t alpha);

// throws arity_mismatch if state.size() != params.width
template<typename FieldT>
void poseidon_permutation(const poseidon_parameters<FieldT> &params, std::vector<FieldT> &state);

// throws arity_mismatch if inputs.size() != params.arity
template<typename FieldT>
FieldT poseidon_crh(const poseidon_parameters<FieldT> &params, const std::vector<FieldT> &inputs);

template<typename FieldT>
FieldT poseidon_sponge(const poseidon_parameters<FieldT> &params, const std::vector<FieldT> &inputs);

/**
 * Appends a single one and then zeros until the length is a multiple of rate.
 * Shared by the native sponge and the sponge gadget.
 */
template<typename T>
std::vector<T> pad_sponge_input(const std::vector<T> &inputs, size_t rate, const T &one, const T &zero);

#include "poseidon_hash.tcc"

#endif //POSEIDON_HASH_H
