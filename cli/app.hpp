//
// Created by gregorian on 11/03/2026.
//

#ifndef CILENS_APP_HPP
#define CILENS_APP_HPP

#include "cli_parser.hpp"
#include "cilens/core/config.h"
#include "cilens/core/result.h"

namespace cilens::cli {

    class App {
    public:
        explicit App(Options options);
        ~App() = default;

        int run();

    private:
        int run_analyze() const;

        [[nodiscard]] core::Result<void> validate_inputs() const;
        [[nodiscard]] core::Result<core::Config> resolve_config() const;

        Options options_;
    };

} // namespace cilens::cli

#endif //CILENS_APP_HPP
