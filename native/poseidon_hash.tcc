/** @file
 *****************************************************************************

 Implementation of interfaces for the native Poseidon hash.

 See poseidon_hash.hpp

 *****************************************************************************/

#include "poseidon_hash.hpp"

template<typename FieldT>
FieldT poseidon_sbox(const FieldT &x, size_t alpha)
{
    return x ^ (unsigned long) alpha;
}

template<typename FieldT>
void poseidon_permutation(const poseidon_parameters<FieldT> &params, std::vector<FieldT> &state)
{
    if (state.size() != params.width){
        throw arity_mismatch(params.width, state.size(), "poseidon_permutation");
    }

    std::vector<FieldT> mixed(params.width);
    for (size_t round = 0; round < params.num_rounds(); ++round){
        for (size_t i = 0; i < params.width; ++i){
            state[i] += params.round_constant(round, i);
        }
        if (params.is_full_round(round)){
            for (size_t i = 0; i < params.width; ++i){
                state[i] = poseidon_sbox(state[i], params.alpha);
            }
        } else {
            state[0] = poseidon_sbox(state[0], params.alpha);
        }
        for (size_t i = 0; i < params.width; ++i){
            mixed[i] = FieldT::zero();
            for (size_t j = 0; j < params.width; ++j){
                mixed[i] += params.mds[i][j] * state[j];
            }
        }
        state.swap(mixed);
    }
}

template<typename FieldT>
FieldT poseidon_crh(const poseidon_parameters<FieldT> &params, const std::vector<FieldT> &inputs)
{
    if (inputs.size() != params.arity){
        throw arity_mismatch(params.arity, inputs.size(), "poseidon_crh");
    }
    std::vector<FieldT> state;
    state.reserve(params.width);
    state.emplace_back(FieldT::zero());
    state.insert(state.end(), inputs.begin(), inputs.end());
    poseidon_permutation(params, state);
    return state[1];
}

template<typename T>
std::vector<T> pad_sponge_input(const std::vector<T> &inputs, size_t rate, const T &one, const T &zero)
{
    std::vector<T> padded(inputs);
    padded.push_back(one);
    while (padded.size() % rate != 0){
        padded.push_back(zero);
    }
    return padded;
}

template<typename FieldT>
FieldT poseidon_sponge(const poseidon_parameters<FieldT> &params, const std::vector<FieldT> &inputs)
{
    const std::vector<FieldT> padded = pad_sponge_input(inputs, params.arity, FieldT::one(), FieldT::zero());

    std::vector<FieldT> state(params.width, FieldT::zero());
    state[0] = FieldT::one();
    for (size_t offset = 0; offset < padded.size(); offset += params.arity){
        for (size_t i = 0; i < params.arity; ++i){
            state[1 + i] += padded[offset + i];
        }
        poseidon_permutation(params, state);
    }
    return state[1];
}
