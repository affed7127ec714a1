/**
 * sqorm/diagnostics.hpp - Non-fatal notices emitted during registration
 *
 * Part of sqorm - a declarative object-relational mapping layer.
 *
 * A sink is handed to the registrar for the duration of one registration
 * call. Sinks must not throw.
 */

#pragma once

#include <cstdio>
#include <functional>
#include <string>

namespace sqorm {

using DiagnosticSink = std::function<void(const std::string&)>;

inline void stderr_diagnostic(const std::string& message) {
    fprintf(stderr, "[sqorm] warning: %s\n", message.c_str());
}

inline DiagnosticSink default_diagnostic_sink() {
    return stderr_diagnostic;
}

} // namespace sqorm
