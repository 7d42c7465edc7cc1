/** @file
 *****************************************************************************

 Declaration of interfaces for Poseidon parameters

 A parameter set fixes the arity of the hash (number of field elements
 absorbed per permutation), the state width (arity + 1, one capacity
 element), the S-box exponent alpha and the round structure:
 full_rounds / 2 full rounds, partial_rounds partial rounds,
 full_rounds / 2 full rounds.

 Each round adds width round constants, applies x^alpha to every state
 element (full round) or to element 0 only (partial round) and multiplies
 the state with the width x width MDS matrix.

 Parameter sets are immutable and shared between the native hash and the
 gadgets through std::shared_ptr<const poseidon_parameters<FieldT>>.
 *****************************************************************************/

#ifndef POSEIDON_PARAMETERS_H
#define POSEIDON_PARAMETERS_H

#include <memory>
#include <string>
#include <vector>

size_t recommended_partial_rounds(size_t width);

template<typename FieldT>
class poseidon_parameters {
public:
    const std::string domain;
    const size_t arity;
    const size_t width;
    const size_t alpha;
    const size_t full_rounds;
    const size_t partial_rounds;
    // width constants per round, round after round
    const std::vector<FieldT> round_constants;
    const std::vector<std::vector<FieldT>> mds;

    /**
     * Throws std::invalid_argument if the parameters are malformed:
     * arity 0, alpha not an odd number >= 3, odd or zero full_rounds,
     * wrong number of round constants, MDS matrix not width x width or singular
     */
    poseidon_parameters(const std::string &domain,
                        size_t arity,
                        size_t alpha,
                        size_t full_rounds,
                        size_t partial_rounds,
                        const std::vector<FieldT> &round_constants,
                        const std::vector<std::vector<FieldT>> &mds);

    /**
     * Derives round constants from the domain separator and uses a Cauchy
     * MDS matrix, with alpha = 5, 8 full rounds and the recommended number
     * of partial rounds for the width
     */
    static std::shared_ptr<const poseidon_parameters<FieldT>> setup(const std::string &domain, size_t arity);

    static std::shared_ptr<const poseidon_parameters<FieldT>> setup(const std::string &domain,
                                                                    size_t arity,
                                                                    size_t alpha,
                                                                    size_t full_rounds,
                                                                    size_t partial_rounds);

    size_t num_rounds() const;
    bool is_full_round(size_t round) const;
    const FieldT &round_constant(size_t round, size_t i) const;
};

template<typename FieldT>
bool is_invertible_matrix(std::vector<std::vector<FieldT>> matrix);

#include "poseidon_parameters.tcc"

#endif //POSEIDON_PARAMETERS_H
