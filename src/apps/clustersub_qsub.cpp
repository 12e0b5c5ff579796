#include <clustersub/job_queue/job_submit.hpp>

int main(int argc, char **argv) {
    return job_submit_main(QSUB_DRIVER, argc, argv);
}
