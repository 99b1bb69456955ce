#pragma once

#include "types/node.hpp"
#include <cstdint>
#include <vector>

namespace das_integrity {

/**
 * Canopy - cached upper levels of the tree, stored after the active tree
 *
 * A canopy of depth k holds the 2^(k+1) - 2 nodes of the top k levels below the
 * root, breadth-first, root excluded. Proofs served by the indexer may stop short
 * of those levels; the missing siblings are read back from here. A zero slot
 * stands for an empty subtree.
 */

/**
 * Number of tree levels the canopy covers.
 *
 * @param canopy_byte_len Size of the canopy region in bytes
 * @param max_depth Tree depth from the header
 * @throws ProofStructureError if the region is not a whole number of nodes,
 *         not a complete subtree, or larger than the tree
 */
uint32_t get_cached_path_length(size_t canopy_byte_len, uint32_t max_depth);

/**
 * Complete a proof with the siblings cached in the canopy.
 *
 * Only as many canopy nodes as needed are appended for the proof to reach
 * max_depth; nodes the proof already carries are kept.
 *
 * @throws ProofStructureError on an invalid canopy or index >= 2^max_depth
 */
void fill_in_proof_from_canopy(const std::vector<uint8_t>& canopy_bytes, uint32_t max_depth,
                               uint32_t index, std::vector<Node>& proof);

} // namespace das_integrity
