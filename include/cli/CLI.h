#pragma once

#include "ColorMode.h"
#include "Options.h"
#include "ParseArgs.h"
#include "Usage.h"
