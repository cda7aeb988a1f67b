#include <curl/curl.h>

#include <new>
#include <system_error>
#include <utility>

namespace mdhealth {

	class curl_errc {
		public:
			static const std::error_category& category() noexcept {
				return _the_cat;
			}
		private:
			static const std::error_category& _the_cat;
	};

}

static inline std::error_code make_error_code(CURLcode e) noexcept {
	return std::error_code{static_cast<int>(e), mdhealth::curl_errc::category()};
}

namespace mdhealth {

class curl_slist {
public:
	constexpr curl_slist() noexcept: _p{nullptr} { }
	~curl_slist() {
		if(_p)
			::curl_slist_free_all(_p);
	}
	curl_slist(const curl_slist&) =delete;
	curl_slist& operator=(const curl_slist&) =delete;
	constexpr curl_slist(curl_slist&& r) noexcept: _p{r._p} {
		r._p=nullptr;
	}
	curl_slist& operator=(curl_slist&& r) noexcept {
		std::swap(_p, r._p);
		return *this;
	}

	struct ::curl_slist* lower() const noexcept { return _p; }

	void append(const char* str) {
		auto tmp=::curl_slist_append(_p, str);
		if(!tmp)
			throw std::bad_alloc{};
		_p=tmp;
	}

private:
	struct ::curl_slist* _p;
};

class curl_easy {
public:
	explicit curl_easy(): _h{::curl_easy_init()} {
		if(!_h)
			throw std::system_error{make_error_code(CURLE_FAILED_INIT)};
	}
	~curl_easy() {
		if(_h)
			::curl_easy_cleanup(_h);
	}
	curl_easy(const curl_easy&) =delete;
	curl_easy& operator=(const curl_easy&) =delete;
	curl_easy(curl_easy&& r) noexcept: _h{r._h} { r._h=nullptr; }
	curl_easy& operator=(curl_easy&& r) noexcept {
		std::swap(_h, r._h);
		return *this;
	}

	CURL* lower() const noexcept { return _h; }

	template<typename T> void setopt(CURLoption opt, T val) {
		auto r=::curl_easy_setopt(_h, opt, val);
		if(r!=CURLE_OK)
			throw std::system_error{make_error_code(r)};
	}
	void perform() {
		auto r=::curl_easy_perform(_h);
		if(r!=CURLE_OK)
			throw std::system_error{make_error_code(r)};
	}
	long response_code() const {
		long code{0};
		auto r=::curl_easy_getinfo(_h, CURLINFO_RESPONSE_CODE, &code);
		if(r!=CURLE_OK)
			throw std::system_error{make_error_code(r)};
		return code;
	}

private:
	CURL* _h;
};

}
