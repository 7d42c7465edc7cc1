/** @file
 *****************************************************************************

 Implementation of circuit value modes.

 See circuit_mode.hpp

 *****************************************************************************/

#include <stdexcept>

#include "circuit_mode.hpp"

circuit_mode combine_modes(circuit_mode a, circuit_mode b)
{
    if (a == Constant){
        return b;
    }
    if (b == Constant){
        return a;
    }
    if (a == Public && b == Public){
        return Public;
    }
    return Private;
}

circuit_mode combine_modes(const std::vector<circuit_mode> &modes)
{
    circuit_mode result = Constant;
    for (size_t i = 0; i < modes.size(); ++i){
        result = combine_modes(result, modes[i]);
    }
    return result;
}

std::string mode_to_string(circuit_mode mode)
{
    switch (mode){
        case Constant:
            return "constant";
        case Public:
            return "public";
        case Private:
            return "private";
    }
    throw std::invalid_argument("unknown circuit mode");
}

circuit_mode mode_from_string(const std::string &name)
{
    if (name == "constant"){
        return Constant;
    } else if (name == "public"){
        return Public;
    } else if (name == "private"){
        return Private;
    }
    throw std::invalid_argument("unknown circuit mode '" + name + "', expected constant, public or private");
}
