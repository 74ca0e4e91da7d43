// backend/src/Backend.cpp
#include <quill/backend/Backend.hpp>
#include <quill/backend/aot/AOTBackend.hpp>
#include <quill/backend/interp/Interpreter.hpp>
#include <quill/backend/jit/JITBackend.hpp>


namespace quill::backend {

    std::unique_ptr<Backend> make_backend(BackendKind kind) {
        switch (kind) {
            case BackendKind::kInterp: return std::make_unique<interp::InterpBackend>();
            case BackendKind::kAot:    return std::make_unique<aot::AOTBackend>();
            case BackendKind::kJit:    return std::make_unique<jit::JITBackend>();
        }
        return nullptr;
    }

    const char* backend_kind_name(BackendKind kind) {
        switch (kind) {
            case BackendKind::kInterp: return "interp";
            case BackendKind::kAot:    return "aot";
            case BackendKind::kJit:    return "jit";
        }
        return "unknown";
    }

} // namespace quill::backend
