// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#define BIONIC_IOCTL_NO_SIGNEDNESS_OVERLOAD

#include <bit-uuid/node_id.h>

#if __has_include(<net/if.h>)
    #define HAVE_NET_IF_H 1
    #include <net/if.h>

    #if __has_include(<net/if_dl.h>)
        #define HAVE_NET_IF_DL_H 1
        #include <net/if_dl.h>
    #endif

    #include <sys/socket.h>
    #include <sys/types.h>
    #include <sys/ioctl.h>
    #if __has_include(<sys/sockio.h>)
        #include <sys/sockio.h>
    #endif
    #include <netinet/in.h>
    #include <unistd.h>
#endif

#include <cstring>
#include <algorithm>
#include <vector>

using namespace buuid;

#ifdef HAVE_NET_IF_H

    #define BUUID_DECLARE_MEMBER_DETECTOR(type, member, name) \
        struct name##_detector { \
            template<class T> \
            static std::true_type detect(decltype(T::member) *); \
            template<class T> \
            static std::false_type detect(...); \
        }; \
        constexpr bool name = decltype(name##_detector::detect<type>(nullptr))::value


    BUUID_DECLARE_MEMBER_DETECTOR(struct sockaddr, sa_len, sockaddr_has_sa_len);

    BUUID_DECLARE_MEMBER_DETECTOR(struct ifreq, ifr_hwaddr, ifreq_has_ifr_hwaddr);


    /*
     * BSD 4.4 defines the size of an ifreq to be
     * max(sizeof(ifreq), sizeof(ifreq.ifr_name)+ifreq.ifr_addr.sa_len
     * However, on some systems, sa_len isn't present, so the size is
     * just sizeof(struct ifreq)
     */
    template<std::same_as<struct ifreq> T>
    static inline size_t ifreq_size(const T & req) {
        if constexpr (sockaddr_has_sa_len) {
            return std::max(sizeof(struct ifreq),
                            sizeof(req.ifr_name) + req.ifr_addr.sa_len);
        } else {
            return sizeof(struct ifreq);
        }
    }

    template<std::same_as<struct ifreq> T>
    static inline const sockaddr & ifreq_hwaddr(const T & req) {
        if constexpr (ifreq_has_ifr_hwaddr)
            return req.ifr_hwaddr;
        else
            return req.ifr_addr;
    }

    template<class R, class FD, class T>
    auto ioctl_type_helper(R (*)(FD, T, ...)) {
        return T{};
    }

    template<class R, class FD, class T, class... Rest>
    auto ioctl_type_helper(R (*)(FD, T, Rest...)) {
        return T{};
    }

    using ioctl_type = decltype(ioctl_type_helper(ioctl));
#endif

static auto to_node_id(const uint8_t * mac) -> uint64_t {
    uint64_t ret = 0;
    for (unsigned i = 0; i < 6; ++i)
        ret = (ret << 8) | mac[i];
    return ret;
}

auto buuid::detect_node_id() -> std::optional<uint64_t> {

#if defined(HAVE_NET_IF_H) && (defined(SIOCGIFHWADDR) || defined(SIOCGENADDR) || defined(HAVE_NET_IF_DL_H))
    auto sd = socket(AF_INET, SOCK_DGRAM, IPPROTO_IP);
    if (sd < 0)
        return std::nullopt;

    struct autoclose_sd_t {
        decltype(sd) s;
        ~autoclose_sd_t() { close(s); }
    } autoclose_sd{sd};

    std::vector<char> buf(1024);

    struct ifconf ifc;
    for ( ; ; ) {
        ifc.ifc_len = int(buf.size());
        ifc.ifc_buf = buf.data();
        if (ioctl(sd, static_cast<ioctl_type>(SIOCGIFCONF), &ifc) < 0)
            return std::nullopt;
        if (int(buf.size()) - ifc.ifc_len > int(sizeof(struct ifreq)))
            break;
        buf.resize(buf.size() + 1024);
    }

    struct ifreq * ifrp;
    for (size_t i = 0; i < size_t(ifc.ifc_len); i += ifreq_size(*ifrp)) {
        ifrp = (struct ifreq *)((uint8_t *)ifc.ifc_buf + i);

        struct ifreq ifr;
        memset(&ifr, 0, sizeof(ifr));
        strncpy(ifr.ifr_name, ifrp->ifr_name, IFNAMSIZ - 1);

        const uint8_t * res = nullptr;
#if defined(SIOCGIFHWADDR)
        if (ioctl(sd, static_cast<ioctl_type>(SIOCGIFHWADDR), &ifr) < 0)
            continue;
        res = (const uint8_t *)&ifreq_hwaddr(ifr).sa_data;
#elif defined(SIOCGENADDR)
        if (ioctl(sd, static_cast<ioctl_type>(SIOCGENADDR), &ifr) < 0)
            continue;
        res = (const uint8_t *) ifr.ifr_enaddr;
#else
        auto sdlp = (struct sockaddr_dl *) &ifrp->ifr_addr;
        if ((sdlp->sdl_family != AF_LINK) || (sdlp->sdl_alen != 6))
            continue;
        res = (const uint8_t *)LLADDR(sdlp);
#endif
        if (res == nullptr || std::all_of(res, res + 6, [](uint8_t b) { return b == 0; }))
            continue;

        return to_node_id(res);
    }
#endif

    return std::nullopt;
}

auto buuid::make_node_id(node_id_kind kind) -> uint64_t {

    if (kind == node_id_kind::detect_system) {
        if (auto detected = detect_node_id())
            return *detected;
    }

    random_generator gen;
    return random_node_id(gen);
}
