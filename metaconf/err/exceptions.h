#pragma once

#include "metaconf/err/check.h"
#include "metaconf/err/codec.h"
#include "metaconf/err/conversion.h"
#include "metaconf/err/fidelity.h"
#include "metaconf/err/fixture.h"
#include "metaconf/err/msg.h"
