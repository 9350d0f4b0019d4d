#ifndef INKPRESS_VERSION_HPP
#define INKPRESS_VERSION_HPP

#define INKPRESS_VERSION_MAJOR 0
#define INKPRESS_VERSION_MINOR 3
#define INKPRESS_VERSION_PATCH 0
#define INKPRESS_VERSION "0.3.0"

#endif // INKPRESS_VERSION_HPP
