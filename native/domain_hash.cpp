/** @file
 *****************************************************************************

 Implementation of domain separated digests.

 See domain_hash.h

 *****************************************************************************/

#include <openssl/sha.h>

#include "native/domain_hash.h"

std::vector<unsigned char> domain_digest(const std::string &domain, const std::string &label, size_t counter){
    const std::string message = std::to_string(domain.size()) + ":" + domain +
                                std::to_string(label.size()) + ":" + label +
                                std::to_string(counter);
    std::vector<unsigned char> digest(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char *>(message.data()), message.size(), digest.data());
    return digest;
}
