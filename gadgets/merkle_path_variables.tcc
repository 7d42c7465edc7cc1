/** @file
 *****************************************************************************

 See merkle_path_variables.hpp

 *****************************************************************************/

#include "merkle_path_variables.hpp"

template<typename FieldT>
void MerklePathVars<FieldT>::allocate(circuit_environment<FieldT> &env,
                                      circuit_mode sibling_mode,
                                      circuit_mode direction_mode,
                                      const MerklePathVals<FieldT> &path,
                                      const std::string &annotation)
{
    levels.clear();
    for (size_t i = 0; i < path.depth(); ++i){
        merkle_path_level<FieldT> level;
        level.sibling = env.new_field(sibling_mode, path.siblings[i], FMT(annotation, ".sibling_%zu", i));
        level.direction = env.new_boolean(direction_mode, path.directions[i], FMT(annotation, ".direction_%zu", i));
        levels.push_back(level);
    }
}
