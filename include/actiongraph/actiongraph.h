#pragma once

// Umbrella header for actiongraph
#include "error.h"
#include "identity_table.h"
#include "output_sink.h"
#include "interning_cache.h"
#include "label.h"
#include "configured_target.h"
#include "artifact.h"
#include "action.h"
#include "dump_options.h"
#include "known_rule_classes.h"
#include "known_rule_configured_targets.h"
#include "known_path_fragments.h"
#include "known_artifacts.h"
#include "known_configurations.h"
#include "known_aspect_descriptors.h"
#include "known_nested_sets.h"
#include "known_actions.h"
#include "action_graph_dump.h"
