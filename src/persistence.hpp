#ifndef PERSISTENCE_HPP
#define PERSISTENCE_HPP

#include "network.hpp"

#include <istream>
#include <ostream>
#include <string>

// Weight file layout, all big-endian:
//   u16      tag length in bytes
//   char[]   topology tag, e.g. "2-2-1-3"
//   f64[]    weights, connectivity layer ascending, then source unit, then
//            destination unit
// The traversal order is part of the format and must never change.

void write_weights(std::ostream &out, const Network &network);

// Throws mismatch_error if the tag differs from the network's, io_error if
// the stream ends early. The network is only modified on success.
void read_weights(std::istream &in, Network &network);

void save_weights(const std::string &file_name, const Network &network);

void load_weights(const std::string &file_name, Network &network);

#endif // PERSISTENCE_HPP
