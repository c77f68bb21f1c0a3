// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

/**
 *   A generation is a row of N cells, one byte per cell holding 0 or 1.
 *   The row is toroidal: cell 0's left neighbor is cell N-1 and cell
 *   N-1's right neighbor is cell 0.
 */
#ifndef ECAGENERATION_H
#define ECAGENERATION_H
#include <stddef.h>
#include <vector>
#include <string>
typedef std::vector<unsigned char> generation ;

// the canonical starting row: all dead except cell width/2
generation singleseed(int width) ;
// one step of the rule table over src, written into dst (resized to match)
void stepgeneration(const unsigned char *table, const generation &src,
                    generation &dst) ;
// CRC-32 of the cell bytes
unsigned long rowdigest(const generation &g) ;
// '#' for live cells and '.' for dead ones
std::string rowtostring(const generation &g, char live='#', char dead='.') ;
// is the row its own left/right reflection?
bool ismirror(const generation &g) ;
int population(const generation &g) ;
#endif
