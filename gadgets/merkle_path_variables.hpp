/** @file
 *****************************************************************************

 merkle path variables

 merkle_path_level: one level of an authentication path in the circuit,
 direction false means the current node is the left child.

 MerklePathVals holds the native path, MerklePathVars allocates it in a
 circuit environment.
 *****************************************************************************/

#ifndef MERKLE_PATH_VARIABLES_H
#define MERKLE_PATH_VARIABLES_H

#include <string>
#include <vector>

#include "circuit/circuit_environment.hpp"
#include "native/merkle_tree.hpp"

template<typename FieldT>
struct merkle_path_level {
    field_value<FieldT> sibling;
    boolean_value<FieldT> direction;
};

template<typename FieldT>
struct MerklePathVals {
    std::vector<FieldT> siblings;
    std::vector<bool> directions;

    MerklePathVals() = default;
    MerklePathVals(const std::vector<native_merkle_path_level<FieldT> > &path){
        for (size_t i = 0; i < path.size(); ++i){
            siblings.push_back(path[i].sibling);
            directions.push_back(path[i].direction);
        }
    }

    size_t depth() const { return siblings.size(); }
};

template<typename FieldT>
struct MerklePathVars {
    std::vector<merkle_path_level<FieldT> > levels;

    void allocate(circuit_environment<FieldT> &env,
                  circuit_mode sibling_mode,
                  circuit_mode direction_mode,
                  const MerklePathVals<FieldT> &path,
                  const std::string &annotation);
};

#include "merkle_path_variables.tcc"

#endif //MERKLE_PATH_VARIABLES_H
