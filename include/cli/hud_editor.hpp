// Full-screen editor for one open MangoHud config document
#pragma once

#include <string>

#include "cli_config.hpp"
#include "kernel/interaction.hpp"

namespace mo {

// Edits a copy of the document's config. `:a` hands the copy to the kernel,
// `:w` also saves it. Returns true when the document was changed.
bool run_hud_editor(InteractionService& svc, const std::string& doc, CliConfig& config);

} // namespace mo
