#include "frontend/frontend_registry.h"
#include "frontend/python_frontend.h"

namespace testforge {

void FrontendRegistry::add(std::unique_ptr<LanguageFrontend> frontend) {
    frontends_.push_back(std::move(frontend));
}

const LanguageFrontend* FrontendRegistry::for_path(const std::filesystem::path& file) const {
    for (const auto& frontend : frontends_) {
        if (frontend->handles(file)) return frontend.get();
    }
    return nullptr;
}

FrontendRegistry FrontendRegistry::with_defaults() {
    FrontendRegistry registry;
    registry.add(std::make_unique<PythonFrontend>());
    return registry;
}

}  // namespace testforge
