#ifndef CONCORD_LIBRARY_H
#define CONCORD_LIBRARY_H

#include "../src/core.hpp"
#include "../src/common/config.hpp"
#include "../src/common/errors.hpp"
#include "../src/common/sample.hpp"
#include "../src/common/save_load.hpp"
#include "../src/layer/layer.hpp"
#include "../src/loss/loss.hpp"
#include "../src/optimizer/optimizer.hpp"
#include "../src/model/model.hpp"



// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Config + load_config/save_config, Embedding adapters, make_model().
//  - Header-only: every component lives under src/ and is composed at the
//    include site.

#endif // CONCORD_LIBRARY_H
