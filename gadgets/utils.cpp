/** @file
 *****************************************************************************

 utilities for gadgets.

 *****************************************************************************/

#include "utils.h"

int num_bits(unsigned long value){
    int n = 0;
    while(value > 0){
        value >>= 1;
        n += 1;
    }
    return n;
}
