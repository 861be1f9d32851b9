/*========================  config.hpp  ========================

   Builds the one immutable ProcessingConfig of a request.
   --------------------------------------------------------------
   defaults → config file → request overrides → forced values

   Each layer is a flat key/value map using the snake_case field
   names (target_width, background_color, ...). Values are parsed
   per field; a bad value names its key in the returned error.

==============================================================*/
#pragma once
#include <map>
#include <string>
#include <vector>
#include "models/ProcessingConfig.hpp"
#include "models/Diagnostics.hpp"

namespace pcanvas
{

using ConfigLayer = std::map<std::string, std::string>;

// Every key applyConfigLayer() understands.
std::vector<std::string> knownConfigKeys();

// Parse and assign each entry of `layer`. Unknown keys are reported on stderr and skipped.
bool applyConfigLayer(ProcessingConfig& cfg, const ConfigLayer& layer, ProcessingError& err);

// Range and format checks on a complete configuration.
bool validateConfig(const ProcessingConfig& cfg, ProcessingError& err);

// Values that must hold whatever the layers asked for. With AI removal on,
// PNG flattening is forced off so the model and the corrector see the alpha.
ConfigLayer forcedLayerFor(const ProcessingConfig& merged);

// Apply `layers` in order on top of `defaults`, then the forced layer, then validate.
bool mergeConfig(const ProcessingConfig& defaults, const std::vector<ConfigLayer>& layers,
                 ProcessingConfig& out, ProcessingError& err);

// Read a flat JSON (or YAML) object into a layer. Strings and numbers are kept;
// sequences and nested objects are skipped with a warning. Booleans go in as
// strings ("false"), since OpenCV's JSON reader rejects bare true/false/null.
bool loadConfigFile(const std::string& path, ConfigLayer& out, ProcessingError& err);

// The configuration as a layer, e.g. for printing or saving.
ConfigLayer configToLayer(const ProcessingConfig& cfg);

}
