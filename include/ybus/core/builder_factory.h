#pragma once

#include <memory>

#include "ybus/admittance/admittance_interface.h"
#include "ybus/io/io_interface.h"

namespace ybus::core {

/**
 * @brief Factory class for creating module implementations
 */
class BuilderFactory {
  public:
    /**
     * @brief Create IO module instance
     * @return Unique pointer to the triplet/CSV IO implementation
     */
    static std::unique_ptr<io::IIOModule> create_io_module();

    /**
     * @brief Create admittance matrix builder
     * @return Unique pointer to the CPU Y-bus builder
     */
    static std::unique_ptr<admittance::IAdmittanceBuilder> create_admittance_builder();
};

}  // namespace ybus::core
