// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>
#include <sortie/engine/ability.h>
#include <sortie/engine/ability_catalog.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sortie::loader {

// A document holds one ability object or {"abilities": [...]}.
Result<std::vector<engine::Ability>> parseAbilities(std::string_view text,
                                                    const std::string& origin = "<memory>");

// A document holds one profile object or {"profiles": [...]}. A profile declares either
// "phases" or a flat "abilities" list (one implicit non-optional phase named "default").
Result<std::vector<engine::AdversaryProfile>>
parseProfiles(std::string_view text, const std::string& origin = "<memory>");

// `path` is a single JSON file or a directory whose *.json files are read in name order.
Result<std::vector<engine::Ability>> loadAbilities(const std::filesystem::path& path);
Result<std::vector<engine::AdversaryProfile>> loadProfiles(const std::filesystem::path& path);

Result<std::shared_ptr<const engine::AbilityCatalog>>
loadCatalog(const std::filesystem::path& path);

// Each profile must be well-formed against the catalog and ids must be unique.
Result<void> validateProfiles(const engine::AbilityCatalog& catalog,
                              const std::vector<engine::AdversaryProfile>& profiles);

} // namespace sortie::loader
