//! @file
//! @copyright See <a href="LICENSE.txt">LICENSE.txt</a>.

#pragma once

#include "batch.hpp"
#include "card.hpp"
#include "color.hpp"
#include "deck.hpp"
#include "elements.hpp"
#include "errors.hpp"
#include "primitives.hpp"
#include "renderer.hpp"
#include "templates.hpp"
#include "tokens.hpp"
