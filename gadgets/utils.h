/** @file
 *****************************************************************************

 interfaces for utilities for using gadgets.

 *****************************************************************************/


#ifndef GADGET_UTILS_H
#define GADGET_UTILS_H

#include <string>
#include <vector>

#include <gmp.h>

int num_bits(unsigned long value);

/**
 * Interprets bytes as a big-endian integer and reduces it into the field
 */
template<typename FieldT>
FieldT field_from_bytes(const std::vector<unsigned char> &bytes){
    const FieldT base(256);
    FieldT result = FieldT::zero();
    for (size_t i = 0; i < bytes.size(); i++){
        result = result * base + FieldT((long) bytes[i]);
    }
    return result;
}

template<typename FieldT>
std::string field_to_decimal(const FieldT &v){
    mpz_t value;
    mpz_init(value);
    v.as_bigint().to_mpz(value);
    char *digits = mpz_get_str(nullptr, 10, value);
    std::string result(digits);
    void (*free_function)(void *, size_t);
    mp_get_memory_functions(nullptr, nullptr, &free_function);
    free_function(digits, result.size() + 1);
    mpz_clear(value);
    return result;
}

#endif //GADGET_UTILS_H
