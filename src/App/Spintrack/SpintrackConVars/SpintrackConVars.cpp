// Copyright (c) 2025, WH, All rights reserved.
#include "SpintrackConVars.h"

#undef SPINTRACK_CONVARDEFS_H
#define DEFINE_SPINTRACK_CONVARS

#include "SpintrackConVarDefs.h"
