#pragma once

#define CORTEX_VERSION "0.1.0"   // Keep in step with project() in CMakeLists.txt

// Store schema versions, one per tier file
#define CORTEX_WORKING_MEMORY_SCHEMA 2
#define CORTEX_KNOWLEDGE_GRAPH_SCHEMA 2
#define CORTEX_CONTEXT_SCHEMA 1
