// Loadable test module whose initialization throws

#include <mudhost/kernel/module.hpp>

#include <stdexcept>

namespace {

class ThrowingModule : public mudhost_kernel::IModule {
public:
    mudhost_core::Result<void> initialize(mudhost_kernel::ModuleContext&) override {
        throw std::runtime_error("division by zero");
    }
};

} // anonymous namespace

MUDHOST_MODULE_ENTRY(ThrowingModule)
