/** @file
 *****************************************************************************

 Implementation of circuit size snapshots.

 See circuit_counts.hpp

 *****************************************************************************/

#include <ostream>

#include "circuit_counts.hpp"

circuit_counts circuit_counts::operator-(const circuit_counts &other) const
{
    circuit_counts result;
    result.num_constants = num_constants - other.num_constants;
    result.num_public = num_public - other.num_public;
    result.num_private = num_private - other.num_private;
    result.num_constraints = num_constraints - other.num_constraints;
    return result;
}

bool circuit_counts::operator==(const circuit_counts &other) const
{
    return num_constants == other.num_constants &&
           num_public == other.num_public &&
           num_private == other.num_private &&
           num_constraints == other.num_constraints;
}

std::ostream& operator<<(std::ostream &out, const circuit_counts &counts)
{
    out << "constants=" << counts.num_constants
        << " public=" << counts.num_public
        << " private=" << counts.num_private
        << " constraints=" << counts.num_constraints;
    return out;
}
