// Loadable test module whose constructor throws

#include <mudhost/kernel/module.hpp>

#include <stdexcept>

namespace {

class BrokenModule : public mudhost_kernel::IModule {
public:
    BrokenModule() {
        throw std::runtime_error("constructor failed");
    }

    mudhost_core::Result<void> initialize(mudhost_kernel::ModuleContext&) override {
        return mudhost_core::Ok();
    }
};

} // anonymous namespace

MUDHOST_MODULE_ENTRY(BrokenModule)
