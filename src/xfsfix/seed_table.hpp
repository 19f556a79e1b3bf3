#ifndef XFSFIX_SEED_TABLE_HPP
#define XFSFIX_SEED_TABLE_HPP
#include <vector>

#include "common/types.hpp"
#include "data_structs.hpp"

namespace XFSFIX {
const std::vector<seed_block>& get_seed_table();

/* Throws std::logic_error when an entry overlaps the header or another entry. */
void validate_seed_table(const std::vector<seed_block>& table);

int64_t seed_table_end(const std::vector<seed_block>& table);
}
#endif
