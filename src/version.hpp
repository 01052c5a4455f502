#pragma once

#define SIERPINSKI_VERSION "0.1.0"
