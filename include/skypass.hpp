/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYPASS_HPP
#define __SKYPASS_HPP

#include <skypass/config.hpp>
#include <skypass/elements.hpp>
#include <skypass/pass_predictor.hpp>
#include <skypass/propagator.hpp>
#include <skypass/radio.hpp>
#include <skypass/tracker.hpp>

#endif
