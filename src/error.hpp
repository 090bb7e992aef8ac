#pragma once

// Single throw site for library errors, so every raise can be found by one grep.
#define SPATIAL_THROW(expr) throw expr
