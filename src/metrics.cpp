#include <headerpush/gateway/metrics.hpp>

#include <sstream>

namespace headerpush::gateway
{
    namespace
    {
        void write_metric(std::ostringstream &os,
                          const char *name,
                          const char *type,
                          const char *help,
                          std::uint64_t value)
        {
            os << "# HELP " << name << " " << help << "\n"
               << "# TYPE " << name << " " << type << "\n"
               << name << " " << value << "\n\n";
        }
    } // namespace

    std::string GatewayMetrics::render_prometheus() const
    {
        std::ostringstream os;

        write_metric(os, "headerpush_connections_total", "counter",
                     "Total tip WebSocket connections accepted",
                     connections_total.load());
        write_metric(os, "headerpush_connections_active", "gauge",
                     "Currently registered tip WebSocket connections",
                     connections_active.load());
        write_metric(os, "headerpush_client_messages_in_total", "counter",
                     "Messages received from clients (ignored)",
                     client_messages_in_total.load());
        write_metric(os, "headerpush_control_frames_in_total", "counter",
                     "Ping, pong and close frames received from clients",
                     control_frames_in_total.load());
        write_metric(os, "headerpush_tip_frames_out_total", "counter",
                     "Tip notification frames written to clients",
                     tip_frames_out_total.load());
        write_metric(os, "headerpush_broadcasts_total", "counter",
                     "Tip change broadcasts performed",
                     broadcasts_total.load());
        write_metric(os, "headerpush_proxy_requests_total", "counter",
                     "REST requests proxied to the header service",
                     proxy_requests_total.load());
        write_metric(os, "headerpush_upstream_unavailable_total", "counter",
                     "Upstream calls that found the header service unreachable",
                     upstream_unavailable_total.load());
        write_metric(os, "headerpush_errors_total", "counter",
                     "Session-fatal errors",
                     errors_total.load());

        return os.str();
    }

} // namespace headerpush::gateway
