#pragma once

// Plain C bridge for host bindings (handle-based, no exceptions cross it)

#include <cstddef>
#include <string>
#include "pulselink_core.h"

extern "C" {
    struct pl_irdc_metrics {
        double dc;
        double rolling_mean;
        double shift;
        int occlusion;
    };

    struct pl_hrv_metrics {
        double sdnn_ms;
        double rmssd_ms;
        double s1;
        double s2;          // valid when has_s2
        double ratio;       // valid when has_ratio
        int has_svd;
        int has_s2;
        int has_ratio;
        int valid;
        size_t rr_count;
    };

    void* pl_irdc_create(double fs, const pulselink::Options* opt);
    void  pl_irdc_push(void* h, const float* x, size_t n);
    int   pl_irdc_poll(void* h, pl_irdc_metrics* out);
    void  pl_irdc_destroy(void* h);

    void* pl_hrv_create(const pulselink::Options* opt);
    void  pl_hrv_add_peak(void* h, double peak_time);
    int   pl_hrv_analyze(void* h, double window_end, pl_hrv_metrics* out);
    void  pl_hrv_destroy(void* h);

    bool  pl_validate_options(double fs,
                              const pulselink::Options* opt,
                              const char** err_code,
                              std::string* err_msg);
}
