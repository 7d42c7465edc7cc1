/** @file
 *****************************************************************************

 Implementation of interfaces for Poseidon parameters.

 See poseidon_parameters.hpp

 *****************************************************************************/

#include <cstdio>
#include <stdexcept>

#include <libff/common/profiling.hpp>

#include "gadgets/utils.h"
#include "native/domain_hash.h"
#include "poseidon_parameters.hpp"

template<typename FieldT>
bool is_invertible_matrix(std::vector<std::vector<FieldT>> matrix)
{
    const size_t n = matrix.size();
    for (size_t col = 0; col < n; ++col){
        size_t pivot = col;
        while (pivot < n && matrix[pivot][col].is_zero()){
            ++pivot;
        }
        if (pivot == n){
            return false;
        }
        std::swap(matrix[col], matrix[pivot]);
        const FieldT pivot_inverse = matrix[col][col].inverse();
        for (size_t row = col + 1; row < n; ++row){
            const FieldT factor = matrix[row][col] * pivot_inverse;
            for (size_t k = col; k < n; ++k){
                matrix[row][k] -= factor * matrix[col][k];
            }
        }
    }
    return true;
}

template<typename FieldT>
poseidon_parameters<FieldT>::poseidon_parameters(const std::string &domain,
                                                 size_t arity,
                                                 size_t alpha,
                                                 size_t full_rounds,
                                                 size_t partial_rounds,
                                                 const std::vector<FieldT> &round_constants,
                                                 const std::vector<std::vector<FieldT>> &mds) :
        domain(domain), arity(arity), width(arity + 1), alpha(alpha),
        full_rounds(full_rounds), partial_rounds(partial_rounds),
        round_constants(round_constants), mds(mds)
{
    if (arity == 0){
        throw std::invalid_argument("poseidon_parameters: arity must be at least 1");
    }
    if (alpha < 3 || alpha % 2 == 0){
        throw std::invalid_argument("poseidon_parameters: alpha must be an odd number >= 3, got " + std::to_string(alpha));
    }
    if (full_rounds == 0 || full_rounds % 2 != 0){
        throw std::invalid_argument("poseidon_parameters: full_rounds must be even and positive, got " + std::to_string(full_rounds));
    }
    if (round_constants.size() != width * num_rounds()){
        throw std::invalid_argument("poseidon_parameters: expected " + std::to_string(width * num_rounds()) +
                                    " round constants, got " + std::to_string(round_constants.size()));
    }
    if (mds.size() != width){
        throw std::invalid_argument("poseidon_parameters: MDS matrix must have " + std::to_string(width) + " rows");
    }
    for (size_t i = 0; i < mds.size(); ++i){
        if (mds[i].size() != width){
            throw std::invalid_argument("poseidon_parameters: MDS row " + std::to_string(i) + " must have " +
                                        std::to_string(width) + " entries");
        }
    }
    if (!is_invertible_matrix(mds)){
        throw std::invalid_argument("poseidon_parameters: MDS matrix is singular");
    }
}

template<typename FieldT>
std::shared_ptr<const poseidon_parameters<FieldT>> poseidon_parameters<FieldT>::setup(const std::string &domain, size_t arity)
{
    return setup(domain, arity, 5, 8, recommended_partial_rounds(arity + 1));
}

template<typename FieldT>
std::shared_ptr<const poseidon_parameters<FieldT>> poseidon_parameters<FieldT>::setup(const std::string &domain,
                                                                                      size_t arity,
                                                                                      size_t alpha,
                                                                                      size_t full_rounds,
                                                                                      size_t partial_rounds)
{
    libff::enter_block("Call to poseidon_parameters::setup");
    const size_t width = arity + 1;
    const size_t rounds = full_rounds + partial_rounds;

    std::vector<FieldT> round_constants;
    round_constants.reserve(width * rounds);
    for (size_t i = 0; i < width * rounds; ++i){
        round_constants.emplace_back(field_from_bytes<FieldT>(domain_digest(domain, "round_constant", i)));
    }

    // Cauchy matrix 1 / (x_i + y_j) with x_i = i, y_j = width + j
    std::vector<std::vector<FieldT>> mds(width, std::vector<FieldT>(width));
    for (size_t i = 0; i < width; ++i){
        for (size_t j = 0; j < width; ++j){
            mds[i][j] = FieldT((long) (i + width + j)).inverse();
        }
    }

    if (!libff::inhibit_profiling_info){
        libff::print_indent(); printf("* Domain: %s, arity %zu, %zu full rounds, %zu partial rounds\n",
                                      domain.c_str(), arity, full_rounds, partial_rounds);
    }
    libff::leave_block("Call to poseidon_parameters::setup");

    return std::make_shared<poseidon_parameters<FieldT>>(domain, arity, alpha, full_rounds, partial_rounds,
                                                         round_constants, mds);
}

template<typename FieldT>
size_t poseidon_parameters<FieldT>::num_rounds() const
{
    return full_rounds + partial_rounds;
}

template<typename FieldT>
bool poseidon_parameters<FieldT>::is_full_round(size_t round) const
{
    return round < full_rounds / 2 || round >= full_rounds / 2 + partial_rounds;
}

template<typename FieldT>
const FieldT &poseidon_parameters<FieldT>::round_constant(size_t round, size_t i) const
{
    return round_constants[round * width + i];
}
