#pragma once

#define INTERSECT_VERSION "0.4.0"
