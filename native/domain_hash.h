/** @file
 *****************************************************************************

 Deterministic byte strings derived from a domain separator

 domain_digest(domain, label, counter) =
     SHA-256(len(domain) ":" domain len(label) ":" label counter)
 with lengths and counter in decimal
 *****************************************************************************/

#ifndef DOMAIN_HASH_H
#define DOMAIN_HASH_H

#include <string>
#include <vector>

std::vector<unsigned char> domain_digest(const std::string &domain, const std::string &label, size_t counter);

#endif //DOMAIN_HASH_H
