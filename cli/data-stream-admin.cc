/**
 * \file
 * Command line tool managing Elasticsearch data streams.
 *
 * \code
 *   data-stream-admin create --data-stream=logs --url=https://elastic1.host:9200 \
 *       --username=elastic --password=secret
 *   data-stream-admin clean --data-stream=logs --retention-period=7 ...
 * \endcode
 */

#include <gflags/gflags.h>

#include "command-line.h"


int main(int argc, char *argv[]) {
    gflags::SetUsageMessage(elasticstream::cli::USAGE);
    return elasticstream::cli::execute(argc, argv);
}
