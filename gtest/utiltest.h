#ifndef MEMBERSHIP_SNARK_UTILTEST_H
#define MEMBERSHIP_SNARK_UTILTEST_H

#include <memory>
#include <vector>

#include "libff/common/default_types/ec_pp.hpp"

#include "native/poseidon_parameters.hpp"

typedef libff::Fr<libff::default_ec_pp> FieldT;

// parameters are derived once per arity and shared by all tests
inline std::shared_ptr<const poseidon_parameters<FieldT> > test_parameters(size_t arity = 2)
{
    static std::vector<std::shared_ptr<const poseidon_parameters<FieldT> > > cache(17);
    if (!cache[arity]){
        cache[arity] = poseidon_parameters<FieldT>::setup("membership-snark-test", arity);
    }
    return cache[arity];
}

inline FieldT field(long value)
{
    return FieldT(value);
}

#endif //MEMBERSHIP_SNARK_UTILTEST_H
