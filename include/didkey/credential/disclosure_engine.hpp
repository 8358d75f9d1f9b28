#pragma once

#include <datapod/datapod.hpp>
#include <didkey/common/config.hpp>
#include <didkey/context/document_loader.hpp>
#include <didkey/suite/registry.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace didkey {

    /// Derives selective-disclosure credentials from base proofs.
    /// A credential is derived at most once: derived proofs are rejected as input.
    class DisclosureEngine {
      public:
        DisclosureEngine(std::shared_ptr<const SuiteRegistry> registry, std::shared_ptr<const DocumentLoader> loader,
                         Config config = Config{});

        /// Reduce an issued credential to its mandatory fields plus the fields addressed by
        /// selective_pointers. presentation_header is bound into the derived proof where the
        /// suite supports it.
        dp::Result<json, dp::Error> derive(const json &credential, const std::vector<std::string> &selective_pointers,
                                           const std::optional<std::string> &presentation_header = std::nullopt) const;

      private:
        std::shared_ptr<const SuiteRegistry> registry_;
        std::shared_ptr<const DocumentLoader> loader_;
        Config config_;
    };

} // namespace didkey
