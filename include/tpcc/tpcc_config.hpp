#pragma once

#include "tpcc/outcomes.hpp"

#include <cstdint>
#include <string>

namespace tpccgw {

/**
 * @brief Tunables shared by the protocol services
 */
struct TpccConfig {
    int64_t stock_level_window = 20;            // recent orders examined by Stock-Level
    DeliveryMode delivery_mode = DeliveryMode::APPLY;
    double max_payment_amount = 10000.0;        // validation ceiling
    std::string region_name = "default";        // New-Order region tag
    int64_t default_page_limit = 50;
};

} // namespace tpccgw
