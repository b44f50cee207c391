#include "exception.h"

Exception::~Exception() noexcept
{}
