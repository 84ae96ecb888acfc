#pragma once

#define CHK_INTERNAL_STRINGIFY(...) #__VA_ARGS__
#define STRINGIFY(...) CHK_INTERNAL_STRINGIFY(__VA_ARGS__)
