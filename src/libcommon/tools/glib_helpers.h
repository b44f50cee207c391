#ifndef GLIB_HELPERS_H
#define GLIB_HELPERS_H

#include <memory>

#include <glib-object.h>

typedef std::unique_ptr<gchar, decltype(&g_free)> GStrPtr;
typedef std::unique_ptr<GHashTable, decltype(&g_hash_table_destroy)> GHashTablePtr;

#endif // GLIB_HELPERS_H
