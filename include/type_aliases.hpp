#ifndef TYPE_ALIASES_H
#define TYPE_ALIASES_H
 
#include "model.hpp"

#include <vector>

// every page of one document, built
using Diagram = std::vector<model::PageModel>;

#endif
