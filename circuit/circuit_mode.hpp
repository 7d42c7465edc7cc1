/** @file
 *****************************************************************************

 Declaration of circuit value modes

 Every circuit value carries a mode:
 Constant: known when the circuit is built, costs no variable and no constraint
 Public: bound to (or computed only from) the primary input
 Private: part of the witness

 Combining two values yields the combined mode:
 Constant is the identity, Public with Public stays Public,
 everything involving Private is Private.
 *****************************************************************************/

#ifndef CIRCUIT_MODE_H
#define CIRCUIT_MODE_H

#include <string>
#include <vector>

enum circuit_mode {Constant, Public, Private};

circuit_mode combine_modes(circuit_mode a, circuit_mode b);

circuit_mode combine_modes(const std::vector<circuit_mode> &modes);

std::string mode_to_string(circuit_mode mode);

// throws std::invalid_argument for unknown names
circuit_mode mode_from_string(const std::string &name);

#endif //CIRCUIT_MODE_H
