/** @file
 *****************************************************************************

 Declaration of circuit size snapshots

 *****************************************************************************/

#ifndef CIRCUIT_COUNTS_H
#define CIRCUIT_COUNTS_H

#include <cstddef>
#include <iosfwd>

/**
 * Snapshot of the size of a circuit, the difference of two snapshots
 * is the cost of the gadgets built in between
 */
struct circuit_counts {
    size_t num_constants;
    size_t num_public;
    size_t num_private;
    size_t num_constraints;

    circuit_counts operator-(const circuit_counts &other) const;
    bool operator==(const circuit_counts &other) const;
};

std::ostream& operator<<(std::ostream &out, const circuit_counts &counts);

#endif //CIRCUIT_COUNTS_H
