#include "pulselink_bridge.h"

#include <memory>
#include <stdexcept>
#include "pulselink_hrv.h"
#include "pulselink_irdc.h"
#include "pulselink_log.h"
#include "pulselink_options.h"

struct _pl_irdc_handle { pulselink::IRDCAnalyzer* p {nullptr}; };
struct _pl_hrv_handle { pulselink::HRVAnalyzer* p {nullptr}; };

void* pl_irdc_create(double fs, const pulselink::Options* opt) {
    pulselink::Options o = opt ? *opt : pulselink::Options{};
    const char* code = nullptr;
    std::string msg;
    if (!pulselink::validateOptions(fs, o, &code, &msg)) {
        PL_LOG_ERROR("pl_irdc_create: %s: %s", code ? code : "", msg.c_str());
        return nullptr;
    }
    std::unique_ptr<_pl_irdc_handle> h(new _pl_irdc_handle());
    try {
        h->p = new pulselink::IRDCAnalyzer(fs, o);
    } catch (const std::invalid_argument& e) {
        PL_LOG_ERROR("pl_irdc_create: %s", e.what());
        return nullptr;
    }
    return h.release();
}

void  pl_irdc_push(void* h, const float* x, size_t n) {
    if (!h || !x) return;
    auto* S = reinterpret_cast<_pl_irdc_handle*>(h);
    for (size_t i = 0; i < n; ++i) S->p->process(static_cast<double>(x[i]));
}

int   pl_irdc_poll(void* h, pl_irdc_metrics* out) {
    if (!h || !out) return 0;
    auto* S = reinterpret_cast<_pl_irdc_handle*>(h);
    if (S->p->bufferedSamples() == 0) return 0;
    const pulselink::IRDCResult r = S->p->currentResult();
    out->dc = r.dcValue;
    out->rolling_mean = r.rollingMean5s;
    out->shift = r.shift5s;
    out->occlusion = S->p->isOcclusion(r.shift5s) ? 1 : 0;
    return 1;
}

void  pl_irdc_destroy(void* h) {
    if (!h) return; auto* S = reinterpret_cast<_pl_irdc_handle*>(h); delete S->p; delete S;
}

void* pl_hrv_create(const pulselink::Options* opt) {
    auto* h = new _pl_hrv_handle();
    pulselink::Options o = opt ? *opt : pulselink::Options{};
    h->p = new pulselink::HRVAnalyzer(o);
    return h;
}

void  pl_hrv_add_peak(void* h, double peak_time) {
    if (!h) return; auto* S = reinterpret_cast<_pl_hrv_handle*>(h); S->p->addPeak(peak_time);
}

int   pl_hrv_analyze(void* h, double window_end, pl_hrv_metrics* out) {
    if (!h || !out) return 0;
    auto* S = reinterpret_cast<_pl_hrv_handle*>(h);
    const pulselink::HRVResult r = S->p->analyzeWindow(window_end);
    *out = pl_hrv_metrics{};
    out->sdnn_ms = r.sdnnMs;
    out->rmssd_ms = r.rmssdMs;
    out->rr_count = r.rrCount;
    out->valid = r.isValid ? 1 : 0;
    if (r.svd) {
        out->has_svd = 1;
        out->s1 = r.svd->s1;
        if (r.svd->s2) { out->has_s2 = 1; out->s2 = *r.svd->s2; }
        if (r.svd->ratio) { out->has_ratio = 1; out->ratio = *r.svd->ratio; }
    }
    return out->valid;
}

void  pl_hrv_destroy(void* h) {
    if (!h) return; auto* S = reinterpret_cast<_pl_hrv_handle*>(h); delete S->p; delete S;
}

bool  pl_validate_options(double fs,
                          const pulselink::Options* opt,
                          const char** err_code,
                          std::string* err_msg) {
    pulselink::Options o = opt ? *opt : pulselink::Options{};
    return pulselink::validateOptions(fs, o, err_code, err_msg);
}
