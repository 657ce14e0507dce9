#include "ybus/core/builder_factory.h"

namespace ybus {

namespace admittance {
std::unique_ptr<IAdmittanceBuilder> create_cpu_admittance_builder();
}

namespace io {
std::unique_ptr<IIOModule> create_triplet_io_module();
}

namespace core {

std::unique_ptr<io::IIOModule> BuilderFactory::create_io_module() {
    return io::create_triplet_io_module();
}

std::unique_ptr<admittance::IAdmittanceBuilder> BuilderFactory::create_admittance_builder() {
    return admittance::create_cpu_admittance_builder();
}

}  // namespace core
}  // namespace ybus
