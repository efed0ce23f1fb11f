#pragma once
// Copyright (c) 2025, WH, All rights reserved.
#ifndef SPINTRACK_CONVARS_H
#define SPINTRACK_CONVARS_H

#include "ConVar.h"
#include "SpintrackConVarDefs.h"

#endif
